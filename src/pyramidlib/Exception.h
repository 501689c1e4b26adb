#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <stdexcept>
#include <string>

/// Fatal runtime error of the pyramid builder (startup, storage or programming errors)
class Exception : public std::runtime_error
{
public:
  explicit Exception(const std::string& message):
      std::runtime_error(message)
  {
  }
};


#endif // EXCEPTION_H

#pragma once
#include <stdexcept>
#include <string>

namespace schemacast
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

} // namespace schemacast

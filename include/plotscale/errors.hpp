#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace plotscale
{

enum class ErrorCode
{
    EmptyDataset,     // extent or normalization requested on zero points
    InvalidValue,     // a projection produced NaN or ±Inf
    InvalidGeometry,  // negative or non-finite drawing area
    InvalidConfig,    // NormalizeConfig failed validation
};

const char* error_code_name(ErrorCode code);

// Every failure the engine reports. Nothing is caught or retried internally;
// the rendering layer decides what an empty or invalid chart looks like.
class NormalizeError : public std::runtime_error
{
   public:
    NormalizeError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

   private:
    ErrorCode code_;
};

class EmptyDatasetError : public NormalizeError
{
   public:
    explicit EmptyDatasetError(const std::string& context);
};

class InvalidValueError : public NormalizeError
{
   public:
    // axis is "x" or "y"; index is the position of the offending point.
    InvalidValueError(const char* axis, size_t index, double value);

    const std::string& axis() const noexcept { return axis_; }
    size_t             index() const noexcept { return index_; }

   private:
    std::string axis_;
    size_t      index_;
};

}   // namespace plotscale

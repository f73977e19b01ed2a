#include <plotscale/errors.hpp>

#include <plotscale/logger.hpp>

namespace plotscale
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::EmptyDataset:
            return "EmptyDataset";
        case ErrorCode::InvalidValue:
            return "InvalidValue";
        case ErrorCode::InvalidGeometry:
            return "InvalidGeometry";
        case ErrorCode::InvalidConfig:
            return "InvalidConfig";
    }
    return "Unknown";
}

NormalizeError::NormalizeError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code)
{
}

EmptyDatasetError::EmptyDatasetError(const std::string& context)
    : NormalizeError(ErrorCode::EmptyDataset, context + " requires at least one point")
{
}

InvalidValueError::InvalidValueError(const char* axis, size_t index, double value)
    : NormalizeError(ErrorCode::InvalidValue,
                     Logger::format_message("non-finite {} projection {} at index {}",
                                            axis,
                                            value,
                                            index)),
      axis_(axis),
      index_(index)
{
}

}   // namespace plotscale

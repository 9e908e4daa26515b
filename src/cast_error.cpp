#include "schemacast/cast.hpp"

#include <sstream>

namespace schemacast
{

std::string to_string(CastReason reason)
{
    switch (reason)
    {
    case CastReason::InvalidType:
        return "invalid_type";
    case CastReason::UnexpectedField:
        return "unexpected_field";
    case CastReason::MissingField:
        return "missing_field";
    case CastReason::MaxProperties:
        return "max_properties";
    case CastReason::MinProperties:
        return "min_properties";
    case CastReason::InvalidDate:
        return "invalid_date";
    case CastReason::InvalidDateTime:
        return "invalid_date_time";
    case CastReason::UnresolvedReference:
        return "unresolved_reference";
    }
    return "invalid_type";
}

std::string path_to_string(const Path& path)
{
    if (path.empty())
        return "/";
    std::string out;
    for (const auto& segment : path)
    {
        out += '/';
        if (const auto* name = std::get_if<std::string>(&segment))
            out += *name;
        else
            out += std::to_string(std::get<std::size_t>(segment));
    }
    return out;
}

std::string CastError::message() const
{
    std::ostringstream ss;
    switch (reason)
    {
    case CastReason::InvalidType:
        ss << "Invalid " << expected.value_or("value") << ". Got: " << type_name(value);
        break;
    case CastReason::UnexpectedField:
        ss << "Unexpected field: " << name.value_or("");
        break;
    case CastReason::MissingField:
        ss << "Missing field: " << name.value_or("");
        break;
    case CastReason::MaxProperties:
        ss << "Object property count " << count.value_or(0) << " is greater than maxProperties: "
           << limit.value_or(0);
        break;
    case CastReason::MinProperties:
        ss << "Object property count " << count.value_or(0) << " is less than minProperties: "
           << limit.value_or(0);
        break;
    case CastReason::InvalidDate:
        ss << "Invalid date. Got: " << value_to_json(value).dump();
        break;
    case CastReason::InvalidDateTime:
        ss << "Invalid date-time. Got: " << value_to_json(value).dump();
        break;
    case CastReason::UnresolvedReference:
        ss << "Unresolved schema reference: " << name.value_or("");
        break;
    }
    ss << " at " << path_string();
    return ss.str();
}

Json CastError::to_json() const
{
    Json path_json = Json::array();
    for (const auto& segment : path)
    {
        if (const auto* key = std::get_if<std::string>(&segment))
            path_json.push_back(*key);
        else
            path_json.push_back(std::get<std::size_t>(segment));
    }
    Json j = {{"reason", schemacast::to_string(reason)},
              {"path", path_json},
              {"value", value_to_json(value)},
              {"message", message()}};
    if (name)
        j["name"] = *name;
    if (expected)
        j["expected"] = *expected;
    if (limit)
        j["limit"] = *limit;
    if (count)
        j["count"] = *count;
    return j;
}

CastResult CastResult::success(Value value)
{
    CastResult r;
    r.value_ = std::move(value);
    return r;
}

CastResult CastResult::failure(CastError error)
{
    CastResult r;
    r.errors_.push_back(std::move(error));
    return r;
}

CastResult CastResult::failure(std::vector<CastError> errors)
{
    CastResult r;
    r.errors_ = std::move(errors);
    return r;
}

const Value& CastResult::value() const
{
    if (!ok())
        throw CastFailure(errors_);
    return value_;
}

Value CastResult::take_value() &&
{
    if (!ok())
        throw CastFailure(errors_);
    return std::move(value_);
}

namespace
{
std::string summarize(const std::vector<CastError>& errors)
{
    if (errors.empty())
        return "Cast failed";
    std::string msg = errors.front().message();
    if (errors.size() > 1)
        msg += " (and " + std::to_string(errors.size() - 1) + " more)";
    return msg;
}
} // namespace

CastFailure::CastFailure(std::vector<CastError> errors)
    : ValidationError(summarize(errors)), errors_(std::move(errors))
{
}

} // namespace schemacast

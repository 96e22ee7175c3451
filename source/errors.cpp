// errors.cpp - definition_error / recursion_depth_error

#include <optics_ext/errors.h>
#include <optics_ext/log.h>

namespace optics_ext {

namespace {

std::string make_definition_message(definition_error::error_type type,
                                    const std::string& subject,
                                    std::string_view detail)
{
    std::string msg;
    switch (type) {
    case definition_error::error_type::missing_get:
        msg = "get is not defined for optic `" + subject + "`";
        break;
    case definition_error::error_type::missing_set:
        msg = "set is not defined for set-based optic `" + subject + "`";
        break;
    case definition_error::error_type::missing_modify:
        msg = "modify is not defined for modify-based optic `" + subject + "`";
        break;
    case definition_error::error_type::missing_field:
        msg = "`" + subject + "` has no field";
        break;
    }
    if (!detail.empty()) {
        msg += type == definition_error::error_type::missing_field ? " `" : ": ";
        msg += detail;
        if (type == definition_error::error_type::missing_field) msg += "`";
    }
    return msg;
}

} // anonymous namespace

definition_error::definition_error(error_type type, std::string subject, std::string_view detail)
    : std::logic_error(make_definition_message(type, subject, detail))
    , type_(type)
    , subject_(std::move(subject))
{}

recursion_depth_error::recursion_depth_error(std::size_t max_depth)
    : std::runtime_error("recursive optic exceeded maximum depth " + std::to_string(max_depth))
    , max_depth_(max_depth)
{}

const char* to_string(definition_error::error_type type) noexcept
{
    switch (type) {
    case definition_error::error_type::missing_get:
        return "missing_get";
    case definition_error::error_type::missing_set:
        return "missing_set";
    case definition_error::error_type::missing_modify:
        return "missing_modify";
    case definition_error::error_type::missing_field:
        return "missing_field";
    default:
        return "unknown";
    }
}

namespace detail {

void throw_missing_field(std::string_view func,
                         std::string_view owner,
                         std::string_view field,
                         std::source_location loc)
{
    definition_error err{definition_error::error_type::missing_field, std::string{owner}, field};
    log_definition_error(func, err.what(), loc);
    throw err;
}

void throw_missing_primitive(std::string_view func,
                             definition_error::error_type type,
                             std::string_view optic_shape,
                             std::source_location loc)
{
    definition_error err{type, std::string{optic_shape}, {}};
    log_definition_error(func, err.what(), loc);
    throw err;
}

} // namespace detail
} // namespace optics_ext

#include "layerkit/instance_descriptor.hpp"
#include "layerkit/errors.hpp"

#include "json.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <memory>
#include <sstream>

namespace layerkit {

    namespace detail {
        // RAII wrapper for json_value_s to ensure proper cleanup
        struct JsonDeleter {
            void operator()(json_value_s *ptr) const {
                if (ptr)
                    free(ptr);
            }
        };
        using JsonPtr = std::unique_ptr<json_value_s, JsonDeleter>;

        inline json_object_element_s *find_element(json_object_s *obj, const char *key) {
            if (!obj)
                return nullptr;
            for (auto *elem = obj->start; elem; elem = elem->next) {
                if (elem->name && strcmp(elem->name->string, key) == 0) {
                    return elem;
                }
            }
            return nullptr;
        }

        inline json_object_s *get_object(json_value_s *val) {
            if (!val || val->type != json_type_object)
                return nullptr;
            return static_cast<json_object_s *>(val->payload);
        }

        inline json_array_s *get_array(json_value_s *val) {
            if (!val || val->type != json_type_array)
                return nullptr;
            return static_cast<json_array_s *>(val->payload);
        }

        inline bool get_string(json_value_s *val, std::string &out) {
            if (!val || val->type != json_type_string)
                return false;
            auto *str = static_cast<json_string_s *>(val->payload);
            out.assign(str->string, str->string_size);
            return true;
        }

        inline bool get_number(json_value_s *val, double &out) {
            if (!val || val->type != json_type_number)
                return false;
            auto *num = static_cast<json_number_s *>(val->payload);
            auto result = std::from_chars(num->number, num->number + num->number_size, out);
            return result.ec == std::errc() && result.ptr == num->number + num->number_size;
        }

        inline std::string escape_string(const std::string &s) {
            std::string result;
            result.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        constexpr const char *constructor_member = "ctor";
        constexpr const char *empty_member = "Empty";

        [[noreturn]] inline void fail(const char *reason) {
            throw FormatError(std::string("layerkit::InstanceDescriptor::fromJson(): ") + reason);
        }
    } // namespace detail

    InstanceDescriptor InstanceDescriptor::constructor(std::string type, double argument) {
        return InstanceDescriptor{std::move(type), Member::Constructor, {argument}};
    }

    InstanceDescriptor InstanceDescriptor::emptyConstant(std::string type) {
        return InstanceDescriptor{std::move(type), Member::EmptyConstant, {}};
    }

    std::string InstanceDescriptor::toJson() const {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << R"({"type":")" << detail::escape_string(type) << R"(","member":")"
            << (isConstructor() ? detail::constructor_member : detail::empty_member) << R"(","args":[)";

        bool first = true;
        for (double arg : arguments) {
            // JSON numbers have no spelling for inf or nan
            if (!std::isfinite(arg)) {
                throw UnsupportedConversionError(
                    "layerkit::InstanceDescriptor::toJson(): non-finite argument has no JSON form");
            }
            if (!first)
                oss << ",";
            first = false;
            oss << std::setprecision(17) << arg;
        }
        oss << "]}";
        return oss.str();
    }

    InstanceDescriptor InstanceDescriptor::fromJson(std::string_view text) {
        detail::JsonPtr root(static_cast<json_value_s *>(json_parse(text.data(), text.size())));
        if (!root)
            detail::fail("failed to parse JSON");

        auto *obj = detail::get_object(root.get());
        if (!obj)
            detail::fail("top-level value is not an object");

        InstanceDescriptor descriptor;

        auto *type_elem = detail::find_element(obj, "type");
        if (!type_elem || !detail::get_string(type_elem->value, descriptor.type) || descriptor.type.empty())
            detail::fail("missing string 'type'");

        std::string member;
        auto *member_elem = detail::find_element(obj, "member");
        if (!member_elem || !detail::get_string(member_elem->value, member))
            detail::fail("missing string 'member'");

        if (member == detail::constructor_member) {
            descriptor.member = Member::Constructor;
        } else if (member == detail::empty_member) {
            descriptor.member = Member::EmptyConstant;
        } else {
            detail::fail("unknown 'member'");
        }

        auto *args_elem = detail::find_element(obj, "args");
        auto *args = args_elem ? detail::get_array(args_elem->value) : nullptr;
        if (!args)
            detail::fail("missing array 'args'");

        for (auto *elem = args->start; elem; elem = elem->next) {
            double value = 0.0;
            if (!detail::get_number(elem->value, value))
                detail::fail("'args' must contain only numbers");
            descriptor.arguments.push_back(value);
        }

        return descriptor;
    }

    std::ostream &operator<<(std::ostream &os, const InstanceDescriptor &descriptor) {
        return os << descriptor.toJson();
    }

} // namespace layerkit

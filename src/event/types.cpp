/// @file types.cpp
/// @brief Formatting and argument helpers for hookchain_event types

#include <hookchain/event/types.hpp>

#include <algorithm>
#include <sstream>

namespace hookchain_event {

const char* target_kind_name(TargetKind kind) {
    switch (kind) {
        case TargetKind::Unknown: return "Unknown";
        case TargetKind::Pool: return "Pool";
        case TargetKind::Engine: return "Engine";
        case TargetKind::Dialect: return "Dialect";
        case TargetKind::SchemaItem: return "SchemaItem";
        case TargetKind::Session: return "Session";
        case TargetKind::Mapper: return "Mapper";
        case TargetKind::ClassManager: return "ClassManager";
        case TargetKind::Attribute: return "Attribute";
        case TargetKind::Query: return "Query";
        case TargetKind::Instrumentation: return "Instrumentation";
        case TargetKind::Instance: return "Instance";
    }
    return "Unknown";
}

std::string to_string(const Target& target) {
    std::ostringstream oss;
    oss << target_kind_name(target.kind) << "#" << target.id;
    if (!target.label.empty()) {
        oss << "(" << target.label << ")";
    }
    return oss.str();
}

std::string to_string(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "None";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, Target>) {
            return to_string(v);
        } else {
            std::string out = "[";
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += to_string(v[i]);
            }
            return out + "]";
        }
    }, value);
}

std::string to_string(const Args& args) {
    std::string out = "(";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(args[i]);
    }
    return out + ")";
}

KwArgs zip_kwargs(const std::vector<std::string>& names, const Args& args) {
    KwArgs out;
    const std::size_t count = std::min(names.size(), args.size());
    for (std::size_t i = 0; i < count; ++i) {
        out.insert_or_assign(names[i], args[i]);
    }
    return out;
}

} // namespace hookchain_event

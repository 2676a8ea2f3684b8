/**
 * @file formatter.cpp
 * @brief Statsd line rendering.
 */

#include "client/formatter.hpp"

#include <format>
#include <type_traits>
#include <variant>

namespace statsd_emitter {

std::string render_value(const MetricRequest& request) {
    std::string text = std::visit([](const auto& v) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::string>) {
            return v;
        } else {
            return std::to_string(v);
        }
    }, request.value);

    switch (request.kind) {
        case MetricKind::GaugeIncrement: return "+" + text;
        case MetricKind::GaugeDecrement: return "-" + text;
        default:                         return text;
    }
}

std::string format_rate(double rate) {
    return std::format("{:g}", rate);
}

std::string format_line(std::string_view prefix,
                        std::string_view stat,
                        const MetricRequest& request,
                        bool with_rate) {
    auto value = render_value(request);
    auto tag = type_tag(request.kind);

    std::string line;
    line.reserve(prefix.size() + stat.size() + value.size() + tag.size() + 16);
    line.append(prefix);
    line.append(stat);
    line.push_back(':');
    line.append(value);
    line.push_back('|');
    line.append(tag);

    if (with_rate) {
        line.append("|@");
        line.append(format_rate(request.rate));
    }
    return line;
}

}  // namespace statsd_emitter

#include <gradebox/common/expected.hpp>
#include <gradebox/protocol/result_message.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace gradebox::protocol {

using nlohmann::json;

std::string encode(const ResultMessage& msg) {
    json obj = {
        {"ok", msg.ok},
        {"message", msg.message},
    };

    if (msg.error) {
        obj["error"] = *msg.error;
    }

    // Compact form never contains a raw newline, so the result is always a single line
    std::string line = obj.dump(-1, ' ', /*ensure_ascii=*/false, json::error_handler_t::replace);
    line += '\n';

    return line;
}

Expected<ResultMessage, std::string> decode(std::string_view text) {
    json obj = json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false);

    if (obj.is_discarded()) {
        return std::string{"not valid JSON"};
    }

    if (!obj.is_object()) {
        return fmt::format("expected a JSON object, got {}", obj.type_name());
    }

    auto ok_iter = obj.find("ok");
    if (ok_iter == obj.end() || !ok_iter->is_boolean()) {
        return std::string{"missing boolean field \"ok\""};
    }

    ResultMessage res{.ok = ok_iter->get<bool>(), .message = {}, .error = std::nullopt};

    if (auto msg_iter = obj.find("message"); msg_iter != obj.end()) {
        res.message = msg_iter->is_string() ? msg_iter->get<std::string>()
                                            : msg_iter->dump(-1, ' ', false, json::error_handler_t::replace);
    }

    if (auto err_iter = obj.find("error"); err_iter != obj.end() && !err_iter->is_null()) {
        res.error = err_iter->is_string() ? err_iter->get<std::string>()
                                          : err_iter->dump(-1, ' ', false, json::error_handler_t::replace);
    }

    return res;
}

} // namespace gradebox::protocol

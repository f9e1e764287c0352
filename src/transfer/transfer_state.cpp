#include "photolink/transfer/transfer_state.hpp"

namespace photolink::transfer {

namespace {
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

std::string describe(const TransferState& state) {
    return std::visit(overloaded{
        [](const Idle&) { return std::string("Idle"); },
        [](const InProgress& progress) {
            return "InProgress(" + std::to_string(progress.current_chunk) + "/" +
                   std::to_string(progress.total_chunks) + ", " +
                   std::to_string(progress.bytes_transferred) + "/" +
                   std::to_string(progress.total_bytes) + " bytes)";
        },
        [](const Success& success) {
            return "Success(" + std::to_string(success.payload.size()) + " bytes)";
        },
        [](const Error& error) {
            std::string text = "Error(" + error.message;
            if (error.status) {
                text += ", " + network::status_name(*error.status);
            }
            return text + ")";
        }
    }, state);
}

}

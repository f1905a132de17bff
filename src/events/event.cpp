#include "lcars/events/event.hpp"
#include <iterator>
#include <type_traits>

namespace lcars::events {

namespace {

template<typename T>
constexpr bool is_transfer_event_v =
    std::is_same_v<T, TransferAdded> || std::is_same_v<T, TransferProgress> ||
    std::is_same_v<T, TransferStatusChanged> || std::is_same_v<T, TransferCompleted> ||
    std::is_same_v<T, TransferError> || std::is_same_v<T, TransferRemoved>;

} // namespace

const char* event_name(const Event& event) {
    static constexpr const char* names[] = {
        "TransferAdded",
        "TransferProgress",
        "TransferStatusChanged",
        "TransferCompleted",
        "TransferError",
        "TransferRemoved",
        "TunnelConnecting",
        "TunnelConnected",
        "TunnelDisconnected",
        "TunnelReconnecting",
        "TunnelStatsUpdate",
        "TunnelError",
    };
    static_assert(std::size(names) == std::variant_size_v<Event>);
    return names[event.index()];
}

std::string event_source_id(const Event& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (is_transfer_event_v<T>) {
            return e.source_id;
        } else {
            return {};
        }
    }, event);
}

bool is_tunnel_event(const Event& event) {
    return std::visit([](const auto& e) {
        return !is_transfer_event_v<std::decay_t<decltype(e)>>;
    }, event);
}

}

#include "server/message_router.hpp"

#include <spdlog/spdlog.h>

void LoggingMessageRouter::route(const ConnectionContext& ctx, const Packet& packet) {
    spdlog::debug("[router] conn {} ({}): {} packet",
                  ctx.connection_id, ctx.remote_address,
                  packet_type_display_name(packet.type()));
}

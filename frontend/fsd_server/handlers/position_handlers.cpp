// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "../protocol_const.hpp"
#include "command_handlers.hpp"

#include <boost/lexical_cast/try_lexical_convert.hpp>

namespace {
    using namespace frontend::fsd;

    // Any field that does not parse leaves the previous position in place.
    std::optional<registry::position> read_position(const packet& pkt) {
        if (pkt.data.size() <= ALTITUDE_FIELD) {
            return std::nullopt;
        }

        registry::position pos;
        if (!boost::conversion::try_lexical_convert(pkt.data[LATITUDE_FIELD], pos.latitude) ||
            !boost::conversion::try_lexical_convert(pkt.data[LONGITUDE_FIELD], pos.longitude) ||
            !boost::conversion::try_lexical_convert(pkt.data[ALTITUDE_FIELD], pos.altitude)) {
            return std::nullopt;
        }
        return pos;
    }
} // namespace

namespace frontend::fsd {
    void handle_position_update(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->debug("[Connection {}] POSITION: {}", connection_string(sender), pkt.destination);

        if (pkt.type == packet_type::PILOT_UPDATE) {
            if (pkt.data.size() > SQUAWK_FIELD && pkt.data[SQUAWK_FIELD] == EMERGENCY_SQUAWK) {
                ctx.log->warn("[Connection {}] POSITION: squawk {} from {}, disconnecting",
                              connection_string(sender),
                              EMERGENCY_SQUAWK,
                              pkt.destination);
                ctx.bus.publish(broadcast::disconnect(sender));
                return;
            }

            if (auto pos = read_position(pkt); pos.has_value()) {
                ctx.registry.mutate(sender, [&pos](registry::session& s) { s.last_position = pos; });
            }
        }

        send_relay(ctx, sender, std::move(pkt));
    }
} // namespace frontend::fsd

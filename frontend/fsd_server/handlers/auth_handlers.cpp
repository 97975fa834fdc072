// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "../fsd_defs/command.hpp"
#include "../packet/packet_utils.hpp"
#include "../protocol_const.hpp"
#include "command_handlers.hpp"

#include <boost/lexical_cast/try_lexical_convert.hpp>

#include <optional>

namespace {
    using namespace frontend::fsd;

    std::optional<std::string> field(const packet& pkt, size_t index) {
        if (index < pkt.data.size()) {
            return pkt.data[index];
        }
        return std::nullopt;
    }

    struct login_fields {
        registry::client_type type;
        std::optional<std::string> real_name;
        std::optional<std::string> network_id;
        std::optional<std::string> password;
        std::optional<int32_t> rating;
    };

    std::optional<int32_t> parse_rating(const std::optional<std::string>& value) {
        int32_t rating = 0;
        if (value.has_value() && boost::conversion::try_lexical_convert(*value, rating)) {
            return rating;
        }
        return std::nullopt;
    }

    // #AA(callsign):SERVER:(full name):(network id):(password):(rating):(protocol version)
    // #AP(callsign):SERVER:(network id):(password):(rating):(protocol version):(num):(full name)
    login_fields parse_login(const packet& pkt) {
        if (pkt.command == fsd_command::ADD_ATC) {
            return login_fields{
                .type = registry::client_type::ATC,
                .real_name = field(pkt, 0),
                .network_id = field(pkt, 1),
                .password = field(pkt, 2),
                .rating = parse_rating(field(pkt, 3)),
            };
        }
        return login_fields{
            .type = registry::client_type::PILOT,
            .real_name = field(pkt, 5),
            .network_id = field(pkt, 0),
            .password = field(pkt, 1),
            .rating = parse_rating(field(pkt, 2)),
        };
    }

    void send_login_sequence(handler_context& ctx,
                             const connection_id& sender,
                             const std::string& callsign,
                             registry::client_type type) {
        for (auto line : WELCOME_LINES) {
            send_reply(ctx, sender, build_text_message(SERVER_SOURCE, callsign, line));
        }

        send_reply(ctx,
                   sender,
                   make_packet(packet_type::REQUEST,
                               fsd_command::CLIENT_QUERY,
                               SERVER_IDENT,
                               callsign,
                               {std::string(query_type::CAPS)}));

        auto ip_packet = make_packet(packet_type::REQUEST,
                                     fsd_command::CLIENT_RESPONSE,
                                     SERVER_IDENT,
                                     callsign,
                                     {std::string(query_type::IP), sender.address().to_string()});

        if (type == registry::client_type::ATC) {
            send_reply(ctx,
                       sender,
                       make_packet(packet_type::REQUEST,
                                   fsd_command::CLIENT_RESPONSE,
                                   SERVER_IDENT,
                                   callsign,
                                   {std::string(ATC_CAPABILITIES)}));
            send_reply(ctx, sender, std::move(ip_packet));
        } else {
            send_reply(ctx, sender, std::move(ip_packet));
            send_reply(ctx,
                       sender,
                       build_error(callsign, fsd_error::NO_FLIGHTPLAN, callsign, error_text::NO_FLIGHTPLAN));
        }
    }
} // namespace

namespace frontend::fsd {
    void handle_identification(handler_context& ctx, const connection_id& sender, packet& pkt) {
        auto client_id = field(pkt, IDENT_CLIENT_ID_FIELD).value_or(std::string());
        ctx.log->info("[Connection {}] ID: {} using client {}", connection_string(sender), pkt.source, client_id);

        if (!ctx.whitelist.is_allowed(client_id)) {
            ctx.log->warn("[Connection {}] ID: client {} is not whitelisted", connection_string(sender), client_id);
            send_reply(ctx,
                       sender,
                       build_error(pkt.source,
                                   fsd_error::UNAUTHORIZED_SOFTWARE,
                                   "",
                                   error_text::UNAUTHORIZED_SOFTWARE));
            return;
        }

        bool updated = ctx.registry.mutate(sender, [&pkt](registry::session& s) {
            s.callsign = pkt.source;
            s.client_string = field(pkt, IDENT_CLIENT_STRING_FIELD);
            s.network_id = field(pkt, IDENT_NETWORK_ID_FIELD);
            s.state = registry::client_state::IDENTIFIED;
        });

        if (!updated) {
            ctx.log->debug("[Connection {}] ID: session is gone", connection_string(sender));
            return;
        }
        ctx.log->info("[Connection {}] ID: {} identified", connection_string(sender), pkt.source);
    }

    void handle_login(handler_context& ctx, const connection_id& sender, packet& pkt) {
        const auto& callsign = pkt.source;
        auto fields = parse_login(pkt);
        ctx.log->info("[Connection {}] LOGIN: {} ({})", connection_string(sender), callsign, pkt.command);

        if (!fields.network_id.has_value()) {
            ctx.log->warn("[Connection {}] LOGIN: missing network id", connection_string(sender));
            return;
        }
        if (!fields.password.has_value()) {
            ctx.log->warn("[Connection {}] LOGIN: missing password", connection_string(sender));
            return;
        }

        auto current = ctx.registry.get(sender);
        if (!current.has_value()) {
            ctx.log->debug("[Connection {}] LOGIN: session is gone", connection_string(sender));
            return;
        }
        if (current->state != registry::client_state::IDENTIFIED) {
            ctx.log->warn("[Connection {}] LOGIN: session is {}, expected IDENTIFIED",
                          connection_string(sender),
                          registry::to_string(current->state));
        }

        auth::user_record user;
        try {
            user = ctx.authenticator.authenticate(*fields.network_id, *fields.password);
        } catch (const auth::auth_error& e) {
            ctx.log->warn("[Connection {}] LOGIN: {} rejected: {}",
                          connection_string(sender),
                          *fields.network_id,
                          e.what());
            send_reply(ctx,
                       sender,
                       build_error(callsign, fsd_error::INVALID_CREDENTIALS, "", error_text::INVALID_CREDENTIALS));
            return;
        }

        if (fields.rating.has_value()) {
            ctx.log->debug("[Connection {}] LOGIN: client asked for rating {}",
                           connection_string(sender),
                           *fields.rating);
        }

        bool updated = ctx.registry.mutate(sender, [&](registry::session& s) {
            s.callsign = callsign;
            s.type = fields.type;
            s.state = registry::client_state::ACTIVE;
            s.real_name = user.real_name;
            s.network_id = *fields.network_id;
            s.rating = fields.type == registry::client_type::ATC ? user.atc_rating : user.pilot_rating;
        });
        if (!updated) {
            ctx.log->debug("[Connection {}] LOGIN: session is gone", connection_string(sender));
            return;
        }

        ctx.registry.index_callsign(callsign, sender);
        ctx.log->info("[Connection {}] LOGIN: {} logged in as {}", connection_string(sender), callsign, user.real_name);

        send_login_sequence(ctx, sender, callsign, fields.type);
        send_relay(ctx, sender, make_packet(packet_type::CLIENT, pkt.command, callsign, SERVER_IDENT, pkt.data));
    }

    void handle_logoff(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->info("[Connection {}] LOGOFF: {}", connection_string(sender), pkt.source);
        ctx.registry.unindex_callsign(pkt.source);
        send_relay(ctx, sender, make_packet(packet_type::CLIENT, pkt.command, pkt.source, pkt.destination, pkt.data));
    }
} // namespace frontend::fsd

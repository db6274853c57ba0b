/**
 * RequestParser — host JSON messages into JobRequests.
 *
 * Accepts the message envelope used on the worker stream:
 *   { "type": "run",    "payload": { "requestId": ..., "scenario": ...,
 *                                    "pokemon": { "player", "opponent" },
 *                                    "field": ..., "options": ...,
 *                                    "evConfig": ... } }
 *   { "type": "cancel", "payload": { "requestId": ... } }
 *
 * Optional members fall back to the struct defaults. Events and actions
 * without an id get a deterministic one ("t1-attack-0", "t1-action-0").
 */

#ifndef EVSIM_IO_REQUEST_PARSER_HPP
#define EVSIM_IO_REQUEST_PARSER_HPP

#include "io/json_reader.hpp"
#include "worker/job_types.hpp"
#include <string>

namespace evsim {

enum class MessageType {
    RUN,
    CANCEL
};

struct HostMessage {
    MessageType type = MessageType::RUN;
    std::string request_id;
    worker::JobRequest request;         // RUN only
};

class RequestParser {
public:
    /**
     * Parse a message envelope.
     * @throws ConfigurationError on an unknown type or malformed payload
     */
    static HostMessage parse_message(const JsonValue& message);

    /// Parse a run payload. @throws ConfigurationError
    static worker::JobRequest parse_request(const JsonValue& payload);

    static Combatant parse_combatant(const JsonValue& pokemon);
    static FieldState parse_field(const JsonValue& field);
    static MoveConfig parse_move(const JsonValue& move);
    static timeline::Scenario parse_scenario(const JsonValue& scenario);
    static grid::GridConfig parse_grid(const JsonValue& ev_config);
};

} // namespace evsim

#endif // EVSIM_IO_REQUEST_PARSER_HPP

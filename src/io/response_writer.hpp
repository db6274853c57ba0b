/**
 * ResponseWriter — JobResponses as JSON Lines.
 *
 * Every response is one compact JSON object on its own line:
 *   {"type":"progress","payload":{"requestId":"r1","progress":{...}}}
 *   {"type":"complete","payload":{"requestId":"r1","summary":{...}}}
 *   {"type":"error","payload":{"requestId":"r1","error":"..."}}
 *   {"type":"cancelled","payload":{"requestId":"r1"}}
 * Optional summary members are left out when the job did not produce them.
 */

#ifndef EVSIM_IO_RESPONSE_WRITER_HPP
#define EVSIM_IO_RESPONSE_WRITER_HPP

#include "io/json_writer.hpp"
#include "worker/job_types.hpp"
#include <ostream>
#include <string>

namespace evsim {

class ResponseWriter {
public:
    /// Write the response followed by a newline, then flush.
    static void write(std::ostream& os, const worker::JobResponse& response);

    /// The response as a single line without the trailing newline.
    static std::string to_line(const worker::JobResponse& response);

    static void write_summary(JsonWriter& w, const worker::JobSummary& summary);
    static void write_snapshot(JsonWriter& w, const timeline::TimelineSnapshot& snap);
};

} // namespace evsim

#endif // EVSIM_IO_RESPONSE_WRITER_HPP

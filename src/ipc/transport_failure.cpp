#include <bsplink/ipc/transport_failure.h>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace bsplink::ipc {

TransportFailureKind classify(const boost::system::error_code& ec) noexcept {
    namespace errc = boost::system::errc;
    if (ec == boost::asio::error::connection_refused ||
        ec == make_error_code(errc::connection_refused) ||
        ec == make_error_code(errc::no_such_file_or_directory) ||
        ec == make_error_code(errc::no_such_device_or_address)) {
        // ENOENT: socket file missing; ENXIO: named pipe without a reader
        return TransportFailureKind::Refused;
    }
    if (ec == boost::asio::error::timed_out || ec == make_error_code(errc::timed_out)) {
        return TransportFailureKind::Timeout;
    }
    if (ec == make_error_code(errc::permission_denied) ||
        ec == make_error_code(errc::operation_not_permitted)) {
        return TransportFailureKind::PermissionDenied;
    }
    if (ec == boost::asio::error::eof) {
        return TransportFailureKind::Eof;
    }
    if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::bad_descriptor) {
        return TransportFailureKind::Cancelled;
    }
    if (ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe ||
        ec == boost::asio::error::connection_aborted || ec == make_error_code(errc::broken_pipe) ||
        ec == make_error_code(errc::connection_reset)) {
        return TransportFailureKind::ResetOrBrokenPipe;
    }
    return TransportFailureKind::Other;
}

} // namespace bsplink::ipc

#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace bsplink::ipc {

// Process-wide io_context driven by a small set of I/O threads. Streams and connections
// default to this executor when TransportOptions does not name one.
class GlobalIOContext {
public:
    static GlobalIOContext& instance();

    boost::asio::io_context& get_io_context();

    static boost::asio::any_io_executor global_executor() {
        return instance().get_io_context().get_executor();
    }

private:
    GlobalIOContext() = default;
    ~GlobalIOContext() noexcept;

    std::unique_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> io_threads_;
    std::once_flag init_flag_;

    void ensure_initialized();
};

} // namespace bsplink::ipc

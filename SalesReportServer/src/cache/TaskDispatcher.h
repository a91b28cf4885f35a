#pragma once

#include <boost/asio.hpp>
#include <functional>

namespace cache {

// Runs a unit of work with no result channel back to whoever dispatched it.
class TaskDispatcher {
public:
    using Task = std::function<void()>;
    virtual ~TaskDispatcher() = default;
    virtual void dispatch(Task task) = 0;
};

// Posts onto an io_context; the task runs later on whichever thread runs it.
class AsioTaskDispatcher : public TaskDispatcher {
public:
    explicit AsioTaskDispatcher(boost::asio::io_context& ioc) : ioc_(ioc) {}
    void dispatch(Task task) override;
private:
    boost::asio::io_context& ioc_;
};

}

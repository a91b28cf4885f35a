#include "DbPool.h"
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include "observability/Logging.h"

namespace db {

namespace {

struct ConnDeleter { void operator()(PGconn* c) const { if (c) PQfinish(c); } };
struct ResultDeleter { void operator()(PGresult* r) const { if (r) PQclear(r); } };
using ConnPtr = std::unique_ptr<PGconn, ConnDeleter>;
using PgResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

DbResult to_db_result(PGresult* pr) {
    DbResult r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (!r.ok) {
        observability::log_warn("dbpool.exec_result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

}

int DbResult::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) if (columns[i] == name) return static_cast<int>(i);
    return -1;
}

struct DbPool::Impl {
    boost::asio::io_context& app_ioc;
    std::string conninfo;
    int workers = 2;

    std::queue<std::function<void()>> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(boost::asio::io_context& ioc, const std::string& ci, int workers_)
        : app_ioc(ioc), conninfo(ci), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    ConnPtr connect_one() {
        ConnPtr c(PQconnectdb(conninfo.c_str()));
        if (!c) return c;
        if (PQstatus(c.get()) != CONNECTION_OK) {
            observability::log_warn("dbpool.connect_failed", {{"msg", std::string(PQerrorMessage(c.get()))}});
            c.reset();
        }
        return c;
    }

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task();
            } catch (const std::exception& e) {
                observability::log_error(std::string("db task exception: ") + e.what());
            }
        }
    }

    void post_task(std::function<void()> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(std::move(f));
        }
        cv_tasks.notify_one();
    }

    void run_query(const std::string& sql, const std::vector<std::string>& params, DbResultCb cb) {
        boost::system::error_code ec;
        DbResult r;
        {
            ConnPtr conn = connect_one();
            if (!conn) {
                ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable);
            } else {
                std::vector<const char*> cparams; cparams.reserve(params.size());
                for (const auto& p : params) cparams.push_back(p.c_str());
                PgResultPtr res(params.empty()
                    ? PQexec(conn.get(), sql.c_str())
                    : PQexecParams(conn.get(), sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0));
                if (!res) {
                    ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
                    observability::log_warn("dbpool.exec_null", {{"msg", std::string(PQerrorMessage(conn.get()))}});
                } else {
                    r = to_db_result(res.get());
                }
            }
        }
        boost::asio::post(app_ioc, [cb = std::move(cb), ec, r = std::move(r)]() mutable { cb(ec, std::move(r)); });
    }
};

DbPool::DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers) {
    impl_ = std::make_unique<Impl>(app_ioc, conninfo, workers);
}

DbPool::~DbPool() = default;

void DbPool::async_exec(const std::string& sql, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, cb = std::move(cb)]() mutable {
        impl->run_query(sql, {}, std::move(cb));
    });
}

void DbPool::async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb) {
    auto impl = impl_.get();
    impl->post_task([impl, sql, params = std::move(params), cb = std::move(cb)]() mutable {
        impl->run_query(sql, params, std::move(cb));
    });
}

void DbPool::async_scalar_int(const std::string& sql, ScalarIntCb cb) {
    async_exec(sql, [cb](const boost::system::error_code& ec, const DbResult& r) {
        if (ec) { cb(ec, 0); return; }
        if (!r.ok || r.rows.empty() || r.rows[0].empty() || !r.rows[0][0].has_value()) { cb(boost::asio::error::invalid_argument, 0); return; }
        int val = 0;
        try { val = std::stoi(r.rows[0][0].value()); }
        catch (const std::exception&) { cb(boost::asio::error::invalid_argument, 0); return; }
        cb({}, val);
    });
}

}

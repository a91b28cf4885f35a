#pragma once

#include "cache/CacheStore.h"
#include "cache/TaskDispatcher.h"
#include "report/Errors.h"
#include "report/SalesAggregator.h"
#include "report/SalesReport.h"
#include <boost/asio/error.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <vector>

// Counts queries and answers from a fixed row set. With hold set, completions
// wait for release_all().
struct FakeAggregator : report::SalesAggregator {
    std::vector<report::SalesAggregate> rows;
    boost::system::error_code fail;
    bool hold = false;
    int calls = 0;
    std::vector<report::TimestampWindow> windows;
    std::vector<std::function<void()>> held;

    void async_query(const report::TimestampWindow& window, report::AggregateCb cb) override {
        ++calls;
        windows.push_back(window);
        auto ec = fail;
        auto out = ec ? std::vector<report::SalesAggregate>{} : rows;
        auto done = [cb, ec, out]{ cb(ec, out); };
        if (hold) held.push_back(done);
        else done();
    }

    void release_all() {
        auto h = std::move(held);
        held.clear();
        for (auto& f : h) f();
    }
};

// Every operation fails with error, by default as if the cache server were unreachable.
struct FailingCacheStore : cache::CacheStore {
    boost::system::error_code error = boost::asio::error::not_connected;
    int gets = 0;
    int sets = 0;
    int deletes = 0;

    void async_get(const std::string&, GetCb cb) override {
        ++gets;
        cb(error, std::nullopt);
    }
    void async_setex(const std::string&, int, const std::string&, SetCb cb) override {
        ++sets;
        cb(error);
    }
    void async_delete_matching(const std::string&, CountCb cb) override {
        ++deletes;
        cb(error, 0);
    }
};

// Holds dispatched tasks until run_pending(), which also runs tasks queued meanwhile.
struct ManualTaskDispatcher : cache::TaskDispatcher {
    std::deque<Task> tasks;

    void dispatch(Task task) override { tasks.push_back(std::move(task)); }

    std::size_t pending() const { return tasks.size(); }

    std::size_t run_pending() {
        std::size_t ran = 0;
        while (!tasks.empty()) {
            Task t = std::move(tasks.front());
            tasks.pop_front();
            t();
            ++ran;
        }
        return ran;
    }
};

inline report::SalesAggregate make_row(const std::string& codigo, const std::string& loja, double venda, double custo) {
    report::SalesAggregate a;
    a.codigo = codigo;
    a.loja = loja;
    a.regiao = std::string("Sul");
    a.qtd_vendas = 3;
    a.total_quantidade = 7;
    a.venda_total = venda;
    a.custo_total = custo;
    a.ultima_sincronizacao = "2024-03-15 10:00:00";
    report::finalize_aggregate(a);
    return a;
}

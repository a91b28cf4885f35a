#include "SalesAggregator.h"
#include "Errors.h"
#include "db/DbPool.h"
#include "observability/Logging.h"
#include <cstdlib>
#include <stdexcept>

namespace report {

std::string aggregation_sql(Grouping g) {
    const bool by_package = g == Grouping::store_package;
    std::string sql =
        "SELECT"
        " u.codigo AS codigo,"
        " u.nome AS loja,"
        " r.nome AS regiao,";
    sql += by_package ? " iv.pacoteid::text AS pacote_id," : " NULL::text AS pacote_id,";
    sql +=
        " COUNT(DISTINCT iv.vendaid) AS qtd_vendas,"
        " SUM(COALESCE(iv.quantidade, 0)) AS total_quantidade,"
        " SUM(COALESCE(iv.valortotal, 0)::double precision) AS venda_total,"
        " SUM(COALESCE(iv.custototal, 0)::double precision) AS custo_total,"
        " COALESCE(MAX(ms.ultima_sincronizacao)::text, '') AS ultima_sincronizacao"
        " FROM itemvenda iv"
        " LEFT JOIN unidadenegocio u ON u.id = iv.unidadenegocioid"
        " LEFT JOIN regiao r ON r.id = u.regiaoid"
        " LEFT JOIN (SELECT unidadenegocioid, MAX(datahora) AS ultima_sincronizacao"
        "            FROM monitor_sincronizacao GROUP BY unidadenegocioid) ms ON ms.unidadenegocioid = u.id"
        " WHERE iv.datahora >= $1::timestamp"
        " AND iv.datahora <= $2::timestamp"
        " AND iv.status = 'F'";
    sql += by_package ? " GROUP BY u.codigo, u.nome, r.nome, iv.pacoteid" : " GROUP BY u.codigo, u.nome, r.nome";
    sql += " ORDER BY venda_total DESC";
    return sql;
}

static double cell_double(const std::vector<std::optional<std::string>>& row, int idx) {
    if (idx < 0 || idx >= (int)row.size() || !row[idx].has_value()) return 0.0;
    const std::string& s = *row[idx];
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str()) {
        observability::log_warn("aggregator.non_numeric_cell", {{"value", s}});
        return 0.0;
    }
    return v;
}

static std::optional<std::string> cell_opt(const std::vector<std::optional<std::string>>& row, int idx) {
    if (idx < 0 || idx >= (int)row.size()) return std::nullopt;
    return row[idx];
}

std::vector<SalesAggregate> map_aggregate_rows(const db::DbResult& r) {
    const int i_codigo = r.column_index("codigo");
    const int i_loja = r.column_index("loja");
    const int i_regiao = r.column_index("regiao");
    const int i_pacote = r.column_index("pacote_id");
    const int i_qtd = r.column_index("qtd_vendas");
    const int i_quant = r.column_index("total_quantidade");
    const int i_venda = r.column_index("venda_total");
    const int i_custo = r.column_index("custo_total");
    const int i_sync = r.column_index("ultima_sincronizacao");

    std::vector<SalesAggregate> out;
    out.reserve(r.rows.size());
    for (const auto& row : r.rows) {
        SalesAggregate a;
        a.codigo = cell_opt(row, i_codigo).value_or(std::string());
        a.loja = cell_opt(row, i_loja).value_or(std::string());
        a.regiao = cell_opt(row, i_regiao);
        a.pacote_id = cell_opt(row, i_pacote);
        a.qtd_vendas = static_cast<int64_t>(cell_double(row, i_qtd));
        a.total_quantidade = cell_double(row, i_quant);
        a.venda_total = cell_double(row, i_venda);
        a.custo_total = cell_double(row, i_custo);
        a.ultima_sincronizacao = cell_opt(row, i_sync).value_or(std::string());
        finalize_aggregate(a);
        out.push_back(std::move(a));
    }
    return out;
}

PgSalesAggregator::PgSalesAggregator(std::shared_ptr<db::DbPool> db, Grouping grouping)
    : db_(std::move(db)), sql_(aggregation_sql(grouping)) {
    if (!db_) throw std::invalid_argument("PgSalesAggregator requires a DbPool");
}

void PgSalesAggregator::async_query(const TimestampWindow& window, AggregateCb cb) {
    std::vector<std::string> params{format_micros(window.start), format_micros(window.end)};
    std::string start = params[0];
    db_->async_exec_params(sql_, std::move(params), [cb, start](const boost::system::error_code& ec, db::DbResult r) {
        if (ec) {
            observability::log_error("aggregator.store_unavailable", {{"err", ec.message()}, {"start", start}});
            cb(errc::store_unavailable, {});
            return;
        }
        if (!r.ok) {
            observability::log_error("aggregator.query_failed", {{"sqlstate", r.sqlstate}, {"msg", r.message}, {"start", start}});
            cb(errc::query_failed, {});
            return;
        }
        cb({}, map_aggregate_rows(r));
    });
}

}

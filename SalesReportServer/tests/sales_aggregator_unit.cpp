#include <iostream>
#include <stdexcept>
#include <string>
#include "db/DbPool.h"
#include "report/SalesAggregator.h"

using namespace report;

int main() {
    {
        auto sql = aggregation_sql(Grouping::store);
        const char* needles[] = {"FROM itemvenda", "unidadenegocio", "regiao", "monitor_sincronizacao", "status = 'F'", "$1", "$2", "ORDER BY venda_total DESC"};
        for (auto n : needles) {
            if (sql.find(n) == std::string::npos) { std::cerr << "store sql missing " << n << "\n"; return 1; }
        }
        if (sql.find("iv.pacoteid") != std::string::npos) { std::cerr << "store sql must not group by package\n"; return 1; }
        auto pkg = aggregation_sql(Grouping::store_package);
        if (pkg.find("GROUP BY u.codigo, u.nome, r.nome, iv.pacoteid") == std::string::npos) { std::cerr << "package sql must group by package\n"; return 1; }
    }

    {
        db::DbResult r;
        r.ok = true;
        r.columns = {"codigo", "loja", "regiao", "pacote_id", "qtd_vendas", "total_quantidade", "venda_total", "custo_total", "ultima_sincronizacao"};
        r.rows.push_back({std::string("001"), std::string("Centro"), std::string("Sul"), std::nullopt, std::string("4"), std::string("10.5"),
                          std::string("200.004"), std::string("50.001"), std::string("2024-03-15 09:58:00")});
        r.rows.push_back({std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
        auto rows = map_aggregate_rows(r);
        if (rows.size() != 2) { std::cerr << "expected 2 rows\n"; return 1; }
        const auto& a = rows[0];
        if (a.codigo != "001" || a.loja != "Centro" || !a.regiao || *a.regiao != "Sul" || a.pacote_id) { std::cerr << "text fields mismatch\n"; return 1; }
        if (a.qtd_vendas != 4 || a.total_quantidade != 10.5) { std::cerr << "count fields mismatch\n"; return 1; }
        if (a.venda_total != 200.0 || a.custo_total != 50.0 || a.cmv != 25.0) { std::cerr << "money fields mismatch cmv=" << a.cmv << "\n"; return 1; }
        const auto& b = rows[1];
        if (!b.codigo.empty() || !b.loja.empty() || b.regiao || b.qtd_vendas != 0 || b.venda_total != 0.0 || b.cmv != 0.0) {
            std::cerr << "NULL row not coerced\n"; return 1;
        }
    }

    
    {
        db::DbResult r;
        r.ok = true;
        r.columns = {"loja", "codigo", "venda_total"};
        r.rows.push_back({std::string("Norte"), std::string("002"), std::string("12.5")});
        auto rows = map_aggregate_rows(r);
        if (rows.size() != 1 || rows[0].codigo != "002" || rows[0].loja != "Norte" || rows[0].venda_total != 12.5 || rows[0].custo_total != 0.0) {
            std::cerr << "column order or missing columns mishandled\n"; return 1;
        }
    }

    {
        bool threw = false;
        try { PgSalesAggregator a(nullptr, Grouping::store); }
        catch (const std::invalid_argument&) { threw = true; }
        if (!threw) { std::cerr << "null pool accepted\n"; return 1; }
    }

    std::cout << "sales_aggregator_unit ok\n";
    return 0;
}

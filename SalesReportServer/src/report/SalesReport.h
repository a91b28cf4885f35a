#pragma once

#include "DateRange.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace report {

struct SalesAggregate {
    std::string codigo;
    std::string loja;
    std::optional<std::string> regiao;
    std::optional<std::string> pacote_id;
    int64_t qtd_vendas = 0;
    double total_quantidade = 0.0;
    double venda_total = 0.0;
    double custo_total = 0.0;
    double cmv = 0.0;
    std::string ultima_sincronizacao;
};

bool operator==(const SalesAggregate& a, const SalesAggregate& b);

enum class Source { cache, database };

const char* source_name(Source s);

struct CachedResult {
    std::string data_consulta;
    std::string periodo_inicio;
    std::string periodo_fim;
    std::vector<SalesAggregate> vendas;
};

struct ResolvedReport {
    CachedResult result;
    Source source = Source::database;
};

double round2(double v);
// cost/revenue percentage, 0 when there is no revenue
double compute_cmv(double custo_total, double venda_total);
void finalize_aggregate(SalesAggregate& a);

CachedResult make_cached_result(const TimestampWindow& window, std::string query_time, std::vector<SalesAggregate> rows);

// cache payload; does not carry the source tag
std::string serialize_cached_result(const CachedResult& r);
// nullopt on any malformed payload
std::optional<CachedResult> deserialize_cached_result(const std::string& payload);

// HTTP response body: cache payload plus total_registros and fonte
std::string render_report_json(const ResolvedReport& r);

}

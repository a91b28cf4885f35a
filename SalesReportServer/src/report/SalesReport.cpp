#include "SalesReport.h"
#include "net/MiniJson.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace report {

bool operator==(const SalesAggregate& a, const SalesAggregate& b) {
    return a.codigo == b.codigo && a.loja == b.loja && a.regiao == b.regiao && a.pacote_id == b.pacote_id &&
           a.qtd_vendas == b.qtd_vendas && a.total_quantidade == b.total_quantidade &&
           a.venda_total == b.venda_total && a.custo_total == b.custo_total && a.cmv == b.cmv &&
           a.ultima_sincronizacao == b.ultima_sincronizacao;
}

const char* source_name(Source s) {
    return s == Source::cache ? "cache" : "database";
}

double round2(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::round(v * 100.0) / 100.0;
}

double compute_cmv(double custo_total, double venda_total) {
    if (!(venda_total > 0.0)) return 0.0;
    return round2(custo_total / venda_total * 100.0);
}

void finalize_aggregate(SalesAggregate& a) {
    a.venda_total = round2(a.venda_total);
    a.custo_total = round2(a.custo_total);
    a.cmv = compute_cmv(a.custo_total, a.venda_total);
}

CachedResult make_cached_result(const TimestampWindow& window, std::string query_time, std::vector<SalesAggregate> rows) {
    CachedResult r;
    r.data_consulta = std::move(query_time);
    r.periodo_inicio = format_seconds(window.start);
    r.periodo_fim = format_seconds(window.end);
    r.vendas = std::move(rows);
    return r;
}

static void write_aggregate(std::ostringstream& ss, const SalesAggregate& a) {
    ss << '{';
    ss << "\"codigo\":\"" << json_escape_resp(a.codigo) << "\",";
    ss << "\"loja\":\"" << json_escape_resp(a.loja) << "\",";
    ss << "\"regiao\":" << json_emit_string_or_null(a.regiao) << ',';
    ss << "\"pacote_id\":" << json_emit_string_or_null(a.pacote_id) << ',';
    ss << "\"qtd_vendas\":" << a.qtd_vendas << ',';
    ss << "\"total_quantidade\":" << json_emit_number(a.total_quantidade) << ',';
    ss << "\"venda_total\":" << json_emit_number(a.venda_total) << ',';
    ss << "\"custo_total\":" << json_emit_number(a.custo_total) << ',';
    ss << "\"cmv\":" << json_emit_number(a.cmv) << ',';
    ss << "\"ultima_sincronizacao\":\"" << json_escape_resp(a.ultima_sincronizacao) << '"';
    ss << '}';
}

static void write_body(std::ostringstream& ss, const CachedResult& r) {
    ss << "\"data_consulta\":\"" << json_escape_resp(r.data_consulta) << "\",";
    ss << "\"periodo_inicio\":\"" << json_escape_resp(r.periodo_inicio) << "\",";
    ss << "\"periodo_fim\":\"" << json_escape_resp(r.periodo_fim) << "\",";
    ss << "\"total_registros\":" << r.vendas.size() << ',';
}

static void write_rows(std::ostringstream& ss, const CachedResult& r) {
    ss << "\"vendas\":[";
    for (size_t i = 0; i < r.vendas.size(); ++i) {
        if (i) ss << ',';
        write_aggregate(ss, r.vendas[i]);
    }
    ss << ']';
}

std::string serialize_cached_result(const CachedResult& r) {
    std::ostringstream ss;
    ss << '{';
    write_body(ss, r);
    write_rows(ss, r);
    ss << '}';
    return ss.str();
}

std::string render_report_json(const ResolvedReport& r) {
    std::ostringstream ss;
    ss << '{';
    write_body(ss, r.result);
    ss << "\"fonte\":\"" << source_name(r.source) << "\",";
    write_rows(ss, r.result);
    ss << '}';
    return ss.str();
}

static const JsonValue& require(const JsonValue& v, const std::string& key, JsonValue::Type type) {
    const JsonValue* f = v.find(key);
    if (!f || f->type != type) throw std::runtime_error("missing or mistyped field " + key);
    return *f;
}

static std::optional<std::string> optional_string(const JsonValue& v, const std::string& key) {
    const JsonValue* f = v.find(key);
    if (!f || f->is_null()) return std::nullopt;
    if (f->type != JsonValue::Type::String) throw std::runtime_error("mistyped field " + key);
    return f->str;
}

std::optional<CachedResult> deserialize_cached_result(const std::string& payload) {
    try {
        JsonValue root = json_parse(payload);
        if (root.type != JsonValue::Type::Object) return std::nullopt;
        CachedResult r;
        r.data_consulta = require(root, "data_consulta", JsonValue::Type::String).str;
        r.periodo_inicio = require(root, "periodo_inicio", JsonValue::Type::String).str;
        r.periodo_fim = require(root, "periodo_fim", JsonValue::Type::String).str;
        const auto& total = require(root, "total_registros", JsonValue::Type::Number);
        const auto& vendas = require(root, "vendas", JsonValue::Type::Array);
        if (total.number != static_cast<double>(vendas.arr.size())) return std::nullopt;
        r.vendas.reserve(vendas.arr.size());
        for (const auto& item : vendas.arr) {
            if (item.type != JsonValue::Type::Object) return std::nullopt;
            SalesAggregate a;
            a.codigo = require(item, "codigo", JsonValue::Type::String).str;
            a.loja = require(item, "loja", JsonValue::Type::String).str;
            a.regiao = optional_string(item, "regiao");
            a.pacote_id = optional_string(item, "pacote_id");
            a.qtd_vendas = static_cast<int64_t>(require(item, "qtd_vendas", JsonValue::Type::Number).number);
            a.total_quantidade = require(item, "total_quantidade", JsonValue::Type::Number).number;
            a.venda_total = require(item, "venda_total", JsonValue::Type::Number).number;
            a.custo_total = require(item, "custo_total", JsonValue::Type::Number).number;
            a.cmv = require(item, "cmv", JsonValue::Type::Number).number;
            a.ultima_sincronizacao = require(item, "ultima_sincronizacao", JsonValue::Type::String).str;
            r.vendas.push_back(std::move(a));
        }
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}

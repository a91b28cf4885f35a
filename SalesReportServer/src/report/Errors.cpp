#include "Errors.h"
#include <string>

namespace report {

namespace {

class ReportCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "report"; }
    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok: return "ok";
            case errc::invalid_date_format: return "Formato de data inválido. Use YYYY-MM-DD";
            case errc::incomplete_range: return "Informe data_inicio e data_fim juntos";
            case errc::invalid_range: return "data_inicio não pode ser maior que data_fim";
            case errc::store_unavailable: return "Erro de conexão com o banco";
            case errc::query_failed: return "Erro ao consultar vendas";
            case errc::cache_unavailable: return "Cache indisponível";
        }
        return "unknown report error";
    }
};

}

const boost::system::error_category& report_category() {
    static ReportCategory cat;
    return cat;
}

boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), report_category());
}

bool is_client_error(const boost::system::error_code& ec) {
    return ec == errc::invalid_date_format || ec == errc::incomplete_range || ec == errc::invalid_range;
}

}

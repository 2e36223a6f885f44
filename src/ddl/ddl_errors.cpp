#include "ddlsort/ddl/ddl_errors.hpp"

#include <string>

namespace ddlsort::ddl {

namespace {

class DdlErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "ddlsort.ddl";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<DdlErrc>(condition)) {
        case DdlErrc::Success:
            return "success";
        case DdlErrc::DependencyCycle:
            return "circular foreign key dependency";
        case DdlErrc::NoRecognizedTables:
            return "no recognized CREATE TABLE statements";
        case DdlErrc::DuplicateTable:
            return "duplicate table definition";
        case DdlErrc::UnknownTable:
            return "table not found";
        case DdlErrc::UnknownWorkload:
            return "unknown workload type";
        case DdlErrc::InvalidRowCount:
            return "invalid row count";
        default:
            return "unknown ddl error";
        }
    }
};

const DdlErrorCategory kCategory{};

}  // namespace

const std::error_category& ddl_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(DdlErrc value) noexcept
{
    return {static_cast<int>(value), ddl_error_category()};
}

}  // namespace ddlsort::ddl

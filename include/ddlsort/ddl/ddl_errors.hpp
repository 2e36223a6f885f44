#pragma once

#include <system_error>

namespace ddlsort::ddl {

enum class DdlErrc {
    Success = 0,
    DependencyCycle,
    NoRecognizedTables,
    DuplicateTable,
    UnknownTable,
    UnknownWorkload,
    InvalidRowCount
};

const std::error_category& ddl_error_category() noexcept;
std::error_code make_error_code(DdlErrc value) noexcept;

}  // namespace ddlsort::ddl

namespace std {

template <>
struct is_error_code_enum<ddlsort::ddl::DdlErrc> : true_type {
};

}  // namespace std

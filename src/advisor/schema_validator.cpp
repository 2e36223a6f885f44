#include "ddlsort/advisor/schema_validator.hpp"

namespace ddlsort::advisor {

SchemaValidation validate_schema(std::string_view ddl, std::string_view)
{
    SchemaValidation validation{};
    validation.text.reserve(kValidationHeader.size() + ddl.size());
    validation.text.append(kValidationHeader);
    validation.text.append(ddl);
    return validation;
}

}  // namespace ddlsort::advisor

#include "integrity/Result.hpp"

namespace cs::integrity {

void to_json(nlohmann::json& j, const DataIntegrityResult& r) {
    j = {
        {"isValid", r.isValid},
        {"checksum", r.checksum},
        {"errors", r.errors},
        {"warnings", r.warnings},
        {"corruptedFields", r.corruptedFields}
    };
    if (r.recoveredData) j["recoveredData"] = *r.recoveredData;
}

}

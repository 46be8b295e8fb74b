#include "lsink/pool/job.h"

namespace lsink::pool {

std::string_view
to_string(JobKind kind)
{
    return kind == JobKind::MATERIALIZE ? "materialize" : "encode";
}

}  // namespace lsink::pool

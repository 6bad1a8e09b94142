#include "applier.hpp"
#include "utils.hpp"

namespace Hookstage {

SubmitResult DryRunApplier::submit(const Manifest& manifest)
{
    submitted_++;
    log_message("[dry-run] Would apply " + manifest.displayName() + " (" + manifest.source + ")");

    SubmitResult result;
    result.accepted = true;
    result.handle = manifest.displayName();
    return result;
}

YAML::Node DryRunApplier::poll(const std::string&)
{
    YAML::Node status;
    YAML::Node condition;
    condition["type"] = "Complete";
    condition["status"] = "True";
    status["conditions"].push_back(condition);
    return status;
}

bool DryRunApplier::remove(const Manifest& manifest)
{
    removed_++;
    log_message("[dry-run] Would delete " + manifest.displayName());
    return true;
}

} // namespace Hookstage

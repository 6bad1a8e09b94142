#ifndef APPLIER_HPP
#define APPLIER_HPP

#include <string>
#include <yaml-cpp/yaml.h>
#include "manifest.hpp"

namespace Hookstage {

/**
 * @brief Outcome of handing one manifest to the target system.
 */
struct SubmitResult
{
    bool accepted = false;
    std::string handle; // Used to poll observed state; valid only when accepted
    std::string error;  // Rejection reason when not accepted
};

/**
 * @class Applier
 * @brief The mechanism that talks to the target system. The orchestrator
 *        treats it as an opaque capability.
 */
class Applier
{
public:
    virtual ~Applier() = default;

    /**
     * @brief Creates or updates the resource described by a manifest.
     *
     * A rejection is reported through the result, not thrown.
     */
    virtual SubmitResult submit(const Manifest& manifest) = 0;

    /**
     * @brief Reads the current observed state (status) of a submitted resource.
     *
     * @param handle The handle returned by a successful submit().
     * @return The status node; null or undefined if none is reported yet.
     * @throws std::runtime_error if the state cannot be read.
     */
    virtual YAML::Node poll(const std::string& handle) = 0;

    /**
     * @brief Deletes the resource described by a manifest.
     * @return True if the resource is gone (including already absent).
     */
    virtual bool remove(const Manifest& manifest) = 0;
};

/**
 * @class DryRunApplier
 * @brief Logs what would be applied. Accepts every submission and reports
 *        every resource as complete.
 */
class DryRunApplier : public Applier
{
public:
    SubmitResult submit(const Manifest& manifest) override;
    YAML::Node poll(const std::string& handle) override;
    bool remove(const Manifest& manifest) override;

    size_t submittedCount() const { return submitted_; }
    size_t removedCount() const { return removed_; }

private:
    size_t submitted_ = 0;
    size_t removed_ = 0;
};

} // namespace Hookstage

#endif // APPLIER_HPP

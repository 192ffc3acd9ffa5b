#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "nostrcast/cryptography/signature_verifier.hpp"
#include "nostrcast/data/data.hpp"
#include "nostrcast/util/clock.hpp"

namespace nostrcast
{
namespace validation
{
enum class ValidationError
{
    NONE,
    MISSING_REQUIRED_FIELD,
    MISSING_REQUIRED_TAG,
    INVALID_TAG_FORMAT,
    INVALID_CONTENT,
    INVALID_IDENTIFIER,
    INVALID_SIGNATURE,
    FROM_FUTURE
};

std::string toString(ValidationError error);

/**
 * @brief The outcome of validating an event.
 */
struct ValidationResult
{
    ValidationError error = ValidationError::NONE;
    std::string message;

    bool isValid() const { return this->error == ValidationError::NONE; };

    static ValidationResult ok() { return ValidationResult(); };

    static ValidationResult fail(ValidationError error, std::string message)
    {
        return ValidationResult{ error, std::move(message) };
    };
};

/**
 * @brief Checks inbound events before they reach any handler.
 * @remark The validator holds no mutable state and may be shared across threads.
 */
class EventValidator
{
public:
    EventValidator(
        std::shared_ptr<util::IClock> clock,
        std::shared_ptr<cryptography::ISignatureVerifier> verifier,
        std::chrono::seconds futureTolerance = std::chrono::minutes(5));

    /**
     * @brief Runs every check on the event.
     * @remark Checks run in order: required fields, canonical ID, signature, timestamp, then
     * kind-specific shape.  The first failure is reported.
     */
    ValidationResult validate(const data::Event& event) const;

    /**
     * @brief Runs every check except signature verification.
     * @remark Use only for events from trusted sources.
     */
    ValidationResult validateWithoutSignature(const data::Event& event) const;

    /**
     * @brief Keeps only the valid events.
     * @param verifySignatures Selects `validate` or `validateWithoutSignature`.
     */
    std::vector<std::shared_ptr<data::Event>> filterValid(
        const std::vector<std::shared_ptr<data::Event>>& events,
        bool verifySignatures = true) const;

private:
    std::shared_ptr<util::IClock> _clock;
    std::shared_ptr<cryptography::ISignatureVerifier> _verifier;
    std::chrono::seconds _futureTolerance;

    ValidationResult _validateRequiredFields(const data::Event& event) const;

    ValidationResult _validateIdentifier(const data::Event& event) const;

    ValidationResult _validateSignature(const data::Event& event) const;

    ValidationResult _validateTimestamp(const data::Event& event) const;

    ValidationResult _validateKind(const data::Event& event) const;

    ValidationResult _validateMetadata(const data::Event& event) const;

    ValidationResult _validateLiveStream(const data::Event& event) const;

    ValidationResult _validateLiveChat(const data::Event& event) const;

    ValidationResult _validateZapReceipt(const data::Event& event) const;
};
} // namespace validation
} // namespace nostrcast

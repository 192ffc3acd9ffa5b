#include <plog/Log.h>

#include "nostrcast/data/coordinate.hpp"
#include "nostrcast/util/encoding.hpp"
#include "nostrcast/validation/event_validator.hpp"

using namespace nlohmann;
using namespace nostrcast::cryptography;
using namespace nostrcast::data;
using namespace nostrcast::util;
using namespace nostrcast::validation;
using namespace std;

string nostrcast::validation::toString(ValidationError error)
{
    switch (error)
    {
    case ValidationError::NONE:
        return "none";
    case ValidationError::MISSING_REQUIRED_FIELD:
        return "missing required field";
    case ValidationError::MISSING_REQUIRED_TAG:
        return "missing required tag";
    case ValidationError::INVALID_TAG_FORMAT:
        return "invalid tag format";
    case ValidationError::INVALID_CONTENT:
        return "invalid content";
    case ValidationError::INVALID_IDENTIFIER:
        return "invalid identifier";
    case ValidationError::INVALID_SIGNATURE:
        return "invalid signature";
    case ValidationError::FROM_FUTURE:
        return "timestamp in the future";
    }
    return "unknown";
};

EventValidator::EventValidator(
    shared_ptr<IClock> clock,
    shared_ptr<ISignatureVerifier> verifier,
    chrono::seconds futureTolerance)
: _clock(clock), _verifier(verifier), _futureTolerance(futureTolerance)
{
};

ValidationResult EventValidator::validate(const Event& event) const
{
    for (auto check : {
        &EventValidator::_validateRequiredFields,
        &EventValidator::_validateIdentifier,
        &EventValidator::_validateSignature,
        &EventValidator::_validateTimestamp,
        &EventValidator::_validateKind })
    {
        auto result = (this->*check)(event);
        if (!result.isValid())
        {
            return result;
        }
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::validateWithoutSignature(const Event& event) const
{
    for (auto check : {
        &EventValidator::_validateRequiredFields,
        &EventValidator::_validateIdentifier,
        &EventValidator::_validateTimestamp,
        &EventValidator::_validateKind })
    {
        auto result = (this->*check)(event);
        if (!result.isValid())
        {
            return result;
        }
    }

    return ValidationResult::ok();
};

vector<shared_ptr<Event>> EventValidator::filterValid(
    const vector<shared_ptr<Event>>& events,
    bool verifySignatures) const
{
    vector<shared_ptr<Event>> validEvents;
    for (const auto& event : events)
    {
        if (event == nullptr)
        {
            continue;
        }

        auto result = verifySignatures
            ? this->validate(*event)
            : this->validateWithoutSignature(*event);

        if (result.isValid())
        {
            validEvents.push_back(event);
        }
        else
        {
            PLOG_DEBUG << "Dropping event " << event->id << ": " << result.message;
        }
    }

    return validEvents;
};

#pragma region Checks

ValidationResult EventValidator::_validateRequiredFields(const Event& event) const
{
    if (event.id.empty())
    {
        return ValidationResult::fail(ValidationError::MISSING_REQUIRED_FIELD, "Event is missing an id.");
    }
    if (event.pubkey.empty())
    {
        return ValidationResult::fail(ValidationError::MISSING_REQUIRED_FIELD, "Event is missing a pubkey.");
    }
    if (event.createdAt <= 0)
    {
        return ValidationResult::fail(ValidationError::MISSING_REQUIRED_FIELD, "Event is missing a created_at timestamp.");
    }
    if (event.sig.empty())
    {
        return ValidationResult::fail(ValidationError::MISSING_REQUIRED_FIELD, "Event is missing a signature.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateIdentifier(const Event& event) const
{
    string expectedId;
    try
    {
        expectedId = event.computeId();
    }
    catch (const json::exception& je)
    {
        return ValidationResult::fail(
            ValidationError::INVALID_IDENTIFIER,
            string("Event data cannot be serialized: ") + je.what());
    }

    if (toLower(event.id) != expectedId)
    {
        return ValidationResult::fail(
            ValidationError::INVALID_IDENTIFIER,
            "Event id " + event.id + " does not match its content hash " + expectedId + ".");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateSignature(const Event& event) const
{
    if (!this->_verifier->verify(toLower(event.pubkey), toLower(event.id), toLower(event.sig)))
    {
        return ValidationResult::fail(
            ValidationError::INVALID_SIGNATURE,
            "Signature on event " + event.id + " does not verify.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateTimestamp(const Event& event) const
{
    auto latest = chrono::system_clock::to_time_t(this->_clock->now() + this->_futureTolerance);
    if (event.createdAt > latest)
    {
        return ValidationResult::fail(
            ValidationError::FROM_FUTURE,
            "Event " + event.id + " is dated " + to_string(event.createdAt) + ", which is in the future.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateKind(const Event& event) const
{
    switch (event.kind)
    {
    case kind::METADATA:
        return this->_validateMetadata(event);
    case kind::LIVE_STREAM:
        return this->_validateLiveStream(event);
    case kind::LIVE_CHAT:
        return this->_validateLiveChat(event);
    case kind::ZAP_RECEIPT:
        return this->_validateZapReceipt(event);
    default:
        return ValidationResult::ok();
    }
};

ValidationResult EventValidator::_validateMetadata(const Event& event) const
{
    if (event.content.empty())
    {
        return ValidationResult::ok();
    }

    auto content = json::parse(event.content, nullptr, false);
    if (content.is_discarded() || !content.is_object())
    {
        return ValidationResult::fail(
            ValidationError::INVALID_CONTENT,
            "Metadata content is not a JSON object.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateLiveStream(const Event& event) const
{
    auto identifier = event.tagValue("d");
    if (!identifier.has_value())
    {
        return ValidationResult::fail(
            ValidationError::MISSING_REQUIRED_TAG,
            "Live stream event is missing a d tag.");
    }

    auto status = event.tagValue("status");
    if (status.has_value())
    {
        string normalized = toLower(*status);
        if (normalized == "live" || normalized == "ended" || normalized == "planned")
        {
            return ValidationResult::ok();
        }

        return ValidationResult::fail(
            ValidationError::INVALID_TAG_FORMAT,
            "Live stream status " + *status + " is not one of live, ended, or planned.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateLiveChat(const Event& event) const
{
    auto reference = event.tagValue("a");
    if (!reference.has_value())
    {
        return ValidationResult::fail(
            ValidationError::MISSING_REQUIRED_TAG,
            "Live chat event is missing an a tag.");
    }

    auto coordinate = Coordinate::parse(*reference);
    if (!coordinate.has_value()
        || coordinate->kind != kind::LIVE_STREAM
        || coordinate->identifier.empty())
    {
        return ValidationResult::fail(
            ValidationError::INVALID_TAG_FORMAT,
            "Live chat a tag " + *reference + " is not a live stream coordinate.");
    }

    return ValidationResult::ok();
};

ValidationResult EventValidator::_validateZapReceipt(const Event& event) const
{
    if (!event.tagValue("bolt11").has_value())
    {
        return ValidationResult::fail(
            ValidationError::MISSING_REQUIRED_TAG,
            "Zap receipt is missing a bolt11 tag.");
    }

    auto description = event.tagValue("description");
    if (!description.has_value())
    {
        return ValidationResult::fail(
            ValidationError::MISSING_REQUIRED_TAG,
            "Zap receipt is missing a description tag.");
    }

    auto zapRequest = json::parse(*description, nullptr, false);
    if (zapRequest.is_discarded()
        || !zapRequest.is_object()
        || !zapRequest.contains("pubkey")
        || !zapRequest["pubkey"].is_string())
    {
        return ValidationResult::fail(
            ValidationError::INVALID_CONTENT,
            "Zap receipt description is not a zap request with a pubkey.");
    }

    return ValidationResult::ok();
};

#pragma endregion

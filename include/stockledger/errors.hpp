#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>
#include "stockledger/ledger.pb.h"

namespace stockledger {

/**
 * Rule names reported in rejections.
 */
namespace rules {
    constexpr const char* NON_ZERO_DELTA = "non_zero_delta";
    constexpr const char* DELTA_SIGN = "delta_sign";
    constexpr const char* CHANGE_TYPE = "change_type";
    constexpr const char* MISSING_KEY = "missing_key";
    constexpr const char* ADJUSTMENT_REFERENCE = "adjustment_reference";
    constexpr const char* RETIRED_REFERENCE = "retired_reference";
    constexpr const char* BUNDLE_NOT_STOCKED = "bundle_not_stocked";
    constexpr const char* EMPTY_BATCH = "empty_batch";
    constexpr const char* QUANTITY_OVERFLOW = "quantity_overflow";
    constexpr const char* INSUFFICIENT_STOCK = "insufficient_stock";
    constexpr const char* OVER_RELEASE = "over_release";
    constexpr const char* BUNDLE_CYCLE = "bundle_cycle";
    constexpr const char* INVALID_BUNDLE = "invalid_bundle_definition";
    constexpr const char* UNKNOWN_REFERENCE = "unknown_reference";
    constexpr const char* PROJECTION_DIVERGENCE = "projection_divergence";
    constexpr const char* SNAPSHOT_UNAVAILABLE = "snapshot_unavailable";
}

/**
 * Base exception for all ledger errors.
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(const std::string& message, std::string rule)
        : std::runtime_error(message), rule_(std::move(rule)) {}

    /**
     * Name of the rule that produced this error.
     */
    const std::string& rule() const { return rule_; }

    /**
     * Returns true if the caller supplied a malformed request.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if a business rule or configuration rejected the request.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if a referenced entity does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the same request may succeed when retried unchanged.
     */
    virtual bool is_retryable() const { return false; }

    /**
     * Returns true if the error indicates a broken internal invariant.
     */
    virtual bool is_fatal() const { return false; }

    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    /**
     * Convert to a gRPC status for the service boundary.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }

private:
    std::string rule_;
};

/**
 * A rejection that carries the values that caused it.
 *
 * The Rejection message travels in the gRPC status details so that
 * clients can reproduce the decision.
 */
class RejectedChangeError : public LedgerError {
public:
    explicit RejectedChangeError(Rejection rejection)
        : LedgerError(describe(rejection), rejection.rule())
        , rejection_(std::move(rejection)) {}

    const Rejection& rejection() const { return rejection_; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(status_code(), what(), rejection_.SerializeAsString());
    }

private:
    static std::string describe(const Rejection& r);

    Rejection rejection_;
};

/**
 * Malformed change request: zero delta, wrong sign, missing reference.
 */
class ValidationError : public RejectedChangeError {
public:
    using RejectedChangeError::RejectedChangeError;

    bool is_invalid_argument() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
};

/**
 * A sold or reserved change would take the key below zero.
 */
class InsufficientStockError : public RejectedChangeError {
public:
    using RejectedChangeError::RejectedChangeError;

    bool is_precondition_failed() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * A released change exceeds the outstanding reserved quantity.
 */
class OverReleaseError : public RejectedChangeError {
public:
    using RejectedChangeError::RejectedChangeError;

    bool is_precondition_failed() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * The bundle graph reachable from a query contains a cycle.
 */
class BundleCycleDetectedError : public LedgerError {
public:
    explicit BundleCycleDetectedError(const std::string& message)
        : LedgerError(message, rules::BUNDLE_CYCLE) {}

    bool is_precondition_failed() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * A bundle has no components, a missing component, or a bad quantity.
 */
class InvalidBundleDefinitionError : public LedgerError {
public:
    explicit InvalidBundleDefinitionError(const std::string& message)
        : LedgerError(message, rules::INVALID_BUNDLE) {}

    bool is_precondition_failed() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * A product, warehouse or company is not known to the catalog.
 */
class UnknownReferenceError : public LedgerError {
public:
    explicit UnknownReferenceError(const std::string& message)
        : LedgerError(message, rules::UNKNOWN_REFERENCE) {}

    bool is_not_found() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
};

/**
 * Rebuilt state disagrees with the live projection. Writes to the key
 * are blocked until it is reconciled.
 */
class ProjectionDivergenceError : public LedgerError {
public:
    explicit ProjectionDivergenceError(const std::string& message)
        : LedgerError(message, rules::PROJECTION_DIVERGENCE) {}

    bool is_fatal() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::DATA_LOSS; }
};

/**
 * The versions needed to serve a pinned snapshot were already discarded.
 */
class SnapshotUnavailableError : public LedgerError {
public:
    explicit SnapshotUnavailableError(const std::string& message)
        : LedgerError(message, rules::SNAPSHOT_UNAVAILABLE) {}

    bool is_retryable() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::ABORTED; }
};

/**
 * Journal or checkpoint I/O failed, or stored data is inconsistent.
 */
class StorageError : public LedgerError {
public:
    explicit StorageError(const std::string& message)
        : LedgerError(message, "storage") {}

    bool is_fatal() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INTERNAL; }
};

/**
 * Invalid environment or catalog document at startup.
 */
class ConfigError : public LedgerError {
public:
    explicit ConfigError(const std::string& message)
        : LedgerError(message, "config") {}

    bool is_invalid_argument() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
};

/**
 * Thrown by LedgerClient when an RPC fails.
 */
class GrpcError : public std::runtime_error {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code,
              const std::string& details = "")
        : std::runtime_error(message), status_code_(status_code) {
        has_rejection_ = !details.empty() && rejection_.ParseFromString(details);
    }

    grpc::StatusCode status_code() const { return status_code_; }

    bool has_rejection() const { return has_rejection_; }
    const Rejection& rejection() const { return rejection_; }

    bool is_not_found() const {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_precondition_failed() const {
        return status_code_ == grpc::StatusCode::FAILED_PRECONDITION;
    }

    bool is_invalid_argument() const {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_retryable() const {
        return status_code_ == grpc::StatusCode::ABORTED ||
               status_code_ == grpc::StatusCode::UNAVAILABLE;
    }

private:
    grpc::StatusCode status_code_;
    Rejection rejection_;
    bool has_rejection_ = false;
};

} // namespace stockledger

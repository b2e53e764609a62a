#pragma once

#include <stdexcept>
#include <string>

namespace Cadis {

enum class ErrorCode {
    ManifestInvalid = 100,
    UnknownPolicy = 101,
    DatasetLoadFailed = 200,
    InvalidCoordinate = 300
};

/**
 * @brief Base of every error the engine throws.
 *
 * Only initialization faults and bad coordinates are thrown. Data-quality
 * conditions met during a lookup are reported through the result instead.
 */
class CadisError : public std::runtime_error {
public:
    CadisError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Common shape of load-time failures: which directory, and why.
 */
class DatasetError : public CadisError {
public:
    DatasetError(ErrorCode code, const std::string& kind,
                 const std::string& dataset_dir, const std::string& reason)
        : CadisError(code, kind + ": dir=" + dataset_dir + " reason=" + reason)
        , dataset_dir_(dataset_dir)
        , reason_(reason) {}

    const std::string& dataset_dir() const noexcept { return dataset_dir_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string dataset_dir_;
    std::string reason_;
};

class ManifestError : public DatasetError {
public:
    ManifestError(const std::string& dataset_dir, const std::string& reason)
        : DatasetError(ErrorCode::ManifestInvalid, "Manifest invalid", dataset_dir, reason) {}
};

class UnknownPolicyError : public DatasetError {
public:
    UnknownPolicyError(const std::string& dataset_dir, const std::string& policy_name)
        : DatasetError(ErrorCode::UnknownPolicy, "Unknown policy", dataset_dir,
                       "policy '" + policy_name + "' is not in the catalog")
        , policy_name_(policy_name) {}

    const std::string& policy_name() const noexcept { return policy_name_; }

private:
    std::string policy_name_;
};

class DatasetLoadError : public DatasetError {
public:
    DatasetLoadError(const std::string& dataset_dir, const std::string& reason)
        : DatasetError(ErrorCode::DatasetLoadFailed, "Dataset load failed", dataset_dir, reason) {}
};

class InvalidCoordinateError : public CadisError {
public:
    InvalidCoordinateError(double lat, double lon)
        : CadisError(ErrorCode::InvalidCoordinate,
                     "Invalid coordinate: lat=" + std::to_string(lat) + " lon=" + std::to_string(lon) +
                     " (expected lat in [-90,90], lon in [-180,180])")
        , lat_(lat), lon_(lon) {}

    double lat() const noexcept { return lat_; }
    double lon() const noexcept { return lon_; }

private:
    double lat_;
    double lon_;
};

} // namespace Cadis

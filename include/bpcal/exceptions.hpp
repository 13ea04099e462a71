#pragma once

#include <bpcal/config.h>
#include <bpcal/errors.h>

#include <stdexcept>
#include <string>
#include <utility>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

/**
 * A generic error. Base type for all other exceptions.
 */
class BPCAL_EXPORT GenericError : public std::exception {
public:
  GenericError() : msg_("BPCAL: Generic error") {}

  explicit GenericError(std::string msg) : msg_(std::move(msg)) {}

  const char* what() const noexcept override { return msg_.c_str(); }

  virtual BpcalError error_code() const noexcept { return BpcalError::BPCAL_GENERIC_ERROR; }

private:
  std::string msg_;
};

class BPCAL_EXPORT InternalError : public GenericError {
public:
  InternalError() : GenericError("BPCAL: Internal error") {}

  explicit InternalError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override { return BpcalError::BPCAL_INTERNAL_ERROR; }
};

class BPCAL_EXPORT InvalidParameterError : public GenericError {
public:
  InvalidParameterError() : GenericError("BPCAL: Invalid parameter error") {}

  explicit InvalidParameterError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override {
    return BpcalError::BPCAL_INVALID_PARAMETER_ERROR;
  }
};

class BPCAL_EXPORT HDF5Error : public GenericError {
public:
  HDF5Error() : GenericError("BPCAL: HDF5 error") {}

  explicit HDF5Error(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override { return BpcalError::BPCAL_HDF5_ERROR; }
};

class BPCAL_EXPORT FileError : public GenericError {
public:
  FileError() : GenericError("BPCAL: File error") {}

  explicit FileError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override { return BpcalError::BPCAL_FILE_ERROR; }
};

/**
 * The report text lacks the markers required to locate solutions or table sections.
 */
class BPCAL_EXPORT MalformedReportError : public GenericError {
public:
  MalformedReportError() : GenericError("BPCAL: Malformed report") {}

  explicit MalformedReportError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override {
    return BpcalError::BPCAL_MALFORMED_REPORT_ERROR;
  }
};

/**
 * Two table sections of the same solution do not describe the same number of rows.
 */
class BPCAL_EXPORT SectionAlignmentError : public GenericError {
public:
  SectionAlignmentError() : GenericError("BPCAL: Section alignment error") {}

  explicit SectionAlignmentError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override {
    return BpcalError::BPCAL_SECTION_ALIGNMENT_ERROR;
  }
};

/**
 * A data line does not hold amplitude / phase pairs for every antenna and polarization.
 */
class BPCAL_EXPORT RecordShapeError : public GenericError {
public:
  RecordShapeError() : GenericError("BPCAL: Record shape error") {}

  explicit RecordShapeError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override { return BpcalError::BPCAL_RECORD_SHAPE_ERROR; }
};

class BPCAL_EXPORT MultiplicityError : public GenericError {
public:
  MultiplicityError() : GenericError("BPCAL: Multiplicity error") {}

  explicit MultiplicityError(std::string msg) : GenericError(std::move(msg)) {}

  BpcalError error_code() const noexcept override { return BpcalError::BPCAL_MULTIPLICITY_ERROR; }
};

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */

// codes.cpp
#include "errors.h"

extern "C" {

// Correctly export integer constants
extern const int KZG_OK                       = static_cast<int>(KZGError::Ok);
extern const int KZG_DESERIALIZATION_ERROR    = static_cast<int>(KZGError::DeserializationError);

extern const int KZG_DOMAIN_SIZE_MISMATCH     = static_cast<int>(KZGError::DomainSizeMismatch);
extern const int KZG_POLYNOMIAL_LENGTH_MISMATCH = static_cast<int>(KZGError::PolynomialLengthMismatch);
extern const int KZG_LENGTH_MISMATCH          = static_cast<int>(KZGError::LengthMismatch);
extern const int KZG_DOMAIN_TOO_LARGE         = static_cast<int>(KZGError::DomainTooLarge);

extern const int KZG_EMPTY_SRS                = static_cast<int>(KZGError::EmptySRS);
extern const int KZG_SRS_LENGTH_MISMATCH      = static_cast<int>(KZGError::SRSLengthMismatch);
extern const int KZG_MALFORMED_TRUSTED_SETUP  = static_cast<int>(KZGError::MalformedTrustedSetup);
extern const int KZG_SETUP_FILE_ERROR         = static_cast<int>(KZGError::SetupFileError);

extern const int KZG_VERIFICATION_FAILED      = static_cast<int>(KZGError::VerificationFailed);

// boundary only, never produced by the library itself
extern const int KZG_INTERNAL_ERROR           = -1;
extern const int KZG_NULL_PARAMETER           = -2;

}

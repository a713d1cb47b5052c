/** @file
 *****************************************************************************

 Error taxonomy shared by the prover, the packager and the host verifier.

 Every failure that can be reported back to a caller carries a
 hostsnark_error_code. Off the host the codes travel inside exceptions
 derived from hostsnark_error; on the host the verifier catches them and
 stores the code in the verification record. A pairing check that returns
 false is not an exception, it becomes pairing_failed.

 *****************************************************************************/

#ifndef HOSTSNARK_ERRORS_HPP_
#define HOSTSNARK_ERRORS_HPP_

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

enum class hostsnark_error_code : uint8_t {
    none = 0,
    format_error = 1,
    invalid_point = 2,
    length_mismatch = 3,
    pairing_failed = 4,
    constraint_unsatisfied = 5,
    insufficient_balance = 6,
    prepared_inputs_mismatch = 7,
    pairing_input_error = 8
};

const char *error_code_name(hostsnark_error_code code);
std::ostream& operator<<(std::ostream &out, hostsnark_error_code code);

class hostsnark_error : public std::runtime_error {
private:
    hostsnark_error_code error_code;

public:
    hostsnark_error(hostsnark_error_code error_code, const std::string &what) :
        std::runtime_error(what), error_code(error_code) {}

    hostsnark_error_code code() const { return error_code; }
};

/** Malformed lengths, widths or non-canonical encodings, detected before any arithmetic */
class format_error : public hostsnark_error {
public:
    explicit format_error(const std::string &what) :
        hostsnark_error(hostsnark_error_code::format_error, what) {}
};

/** Point is not on the curve, or (G2) not in the prime order subgroup */
class invalid_point_error : public hostsnark_error {
public:
    explicit invalid_point_error(const std::string &what) :
        hostsnark_error(hostsnark_error_code::invalid_point, what) {}
};

class length_mismatch_error : public hostsnark_error {
public:
    explicit length_mismatch_error(const std::string &what) :
        hostsnark_error(hostsnark_error_code::length_mismatch, what) {}
};

class constraint_unsatisfied_error : public hostsnark_error {
public:
    explicit constraint_unsatisfied_error(const std::string &what) :
        hostsnark_error(hostsnark_error_code::constraint_unsatisfied, what) {}
};

#endif // HOSTSNARK_ERRORS_HPP_

/** @file
 *****************************************************************************

 Names for error codes, see errors.hpp

 *****************************************************************************/

#include "errors.hpp"

const char *error_code_name(hostsnark_error_code code)
{
    switch (code) {
        case hostsnark_error_code::none:
            return "None";
        case hostsnark_error_code::format_error:
            return "FormatError";
        case hostsnark_error_code::invalid_point:
            return "InvalidPointError";
        case hostsnark_error_code::length_mismatch:
            return "LengthMismatchError";
        case hostsnark_error_code::pairing_failed:
            return "PairingFailed";
        case hostsnark_error_code::constraint_unsatisfied:
            return "ConstraintUnsatisfiedError";
        case hostsnark_error_code::insufficient_balance:
            return "InsufficientBalance";
        case hostsnark_error_code::prepared_inputs_mismatch:
            return "PreparedInputsMismatch";
        case hostsnark_error_code::pairing_input_error:
            return "PairingInputError";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream &out, hostsnark_error_code code)
{
    out << error_code_name(code);
    return out;
}

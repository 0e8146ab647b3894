#pragma once
// TSK402_Command_Validation POSIX word splitting without expansion

#include <string>
#include <string_view>
#include <vector>

namespace nr::exec {

// Splits `text` into words the way a POSIX shell would before expansion:
// single quotes are literal, double quotes honour \" \\ \$ \` escapes, a
// backslash outside quotes escapes the next byte. Words are separated by
// blanks (space, tab). Nothing is expanded or interpreted, so operator
// characters and newlines stay inside the word they appear in.
//
// Throws ValidationError{kMalformedCommand} on an unterminated quote or a
// trailing backslash.
std::vector<std::string> SplitShellWords(std::string_view text);

}  // namespace nr::exec

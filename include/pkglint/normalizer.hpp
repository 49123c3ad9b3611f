#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pkglint {

// Spaces emitted per indentation level
inline constexpr size_t kIndentWidth = 4;

// Scan state of the normalizer. inside_brace is a single flag rather than a
// stack: a '}' seen while it is clear is dropped.
struct NormalizerState {
    size_t indent_level = 0;
    bool inside_brace = false;
    bool inside_comment = false;
};

// Rewrite source text in canonical form, in one forward pass:
//
//   {        "{" newline, indent one level deeper
//   }        dedent, newline, "}", newline (only inside braces); spaces
//            ending the previous line are dropped first
//   ;        ";" newline
//   :        ": "
//   (        "( "
//   )        " )", after padding to a space if the output does not end
//            in one
//   //       starts a comment; the rest of the line is copied verbatim
//   newline  dropped, except the one ending a comment
//   spaces   runs collapse to one
//
// Every newline is followed by the current indentation. Trailing whitespace
// is trimmed. String literals are not recognized.
std::string normalize(std::string_view source);

} // namespace pkglint

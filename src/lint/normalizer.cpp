#include <pkglint/normalizer.hpp>

namespace pkglint {

namespace {

void newline(std::string& out, const NormalizerState& st) {
    out.push_back('\n');
    out.append(st.indent_level * kIndentWidth, ' ');
}

bool last_is_space(const std::string& out) {
    return !out.empty() && out.back() == ' ';
}

// Drop spaces that follow text on the current line. A run that directly
// follows a newline is indentation and stays.
void trim_trailing_spaces(std::string& out) {
    size_t end = out.find_last_not_of(' ');
    if (end == std::string::npos || out[end] == '\n') return;
    out.erase(end + 1);
}

} // namespace

std::string normalize(std::string_view source) {
    NormalizerState st;
    std::string out;
    out.reserve(source.size() + source.size() / 4);

    for (size_t i = 0; i < source.size(); ++i) {
        char c = source[i];

        if (st.inside_comment) {
            if (c == '\n') {
                st.inside_comment = false;
                newline(out, st);
            } else {
                out.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '{':
                out.push_back('{');
                ++st.indent_level;
                newline(out, st);
                st.inside_brace = true;
                break;
            case '}':
                if (st.inside_brace) {
                    --st.indent_level;
                    trim_trailing_spaces(out);
                    newline(out, st);
                    out.push_back('}');
                    newline(out, st);
                    st.inside_brace = st.indent_level > 0;
                }
                break;
            case ';':
                out.push_back(';');
                newline(out, st);
                break;
            case ':':
                out += ": ";
                break;
            case '(':
                out += "( ";
                break;
            case ')':
                // ")" is always preceded by two spaces
                if (!last_is_space(out)) out.push_back(' ');
                out += " )";
                break;
            case '/':
                // Slashes made adjacent by a dropped character also open a comment
                if (!out.empty() && out.back() == '/') {
                    out.push_back('/');
                    st.inside_comment = true;
                    break;
                }
                out.push_back('/');
                if (i + 1 < source.size() && source[i + 1] == '/') {
                    out.push_back('/');
                    ++i;
                    st.inside_comment = true;
                }
                break;
            case '\n':
                break;
            case ' ':
                if (!last_is_space(out)) out.push_back(' ');
                break;
            default:
                out.push_back(c);
                break;
        }
    }

    size_t end = out.find_last_not_of(" \t\r\n\v\f");
    out.erase(end == std::string::npos ? 0 : end + 1);
    return out;
}

} // namespace pkglint

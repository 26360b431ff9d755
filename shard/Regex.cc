#include "shard/Regex.hh"

#include <sstream>
#include <stdexcept>

#include "shard/Text.hh"

namespace shard {

namespace {

std::string error_message(int error_number) {
  PCRE2_UCHAR buffer[256];  // NOLINT
  pcre2_get_error_message(error_number, buffer, sizeof(buffer));
  return std::string(reinterpret_cast<const char *>(buffer));
}

}  // namespace

Regex::Regex(const std::string &pattern, uint32_t options)
    : pattern_(pattern),
      re_(pcre2_compile(PCRE2_SPTR(pattern.c_str()), /* the pattern */
                        PCRE2_ZERO_TERMINATED, /* pattern is zero-terminated */
                        options,               /* options */
                        &error_number_,        /* for error number */
                        &error_offset_,        /* for error offset */
                        nullptr))              /* use default compile context */
{
  if (re_ == nullptr) {
    throw std::invalid_argument(get_error_message() + " in /" + pattern_ +
                                "/");
  }

  uint32_t have_jit = 0;
  pcre2_config(PCRE2_CONFIG_JIT, &have_jit);
  if (have_jit) {
    // A failed JIT compile leaves the interpreter in charge; not an error.
    pcre2_jit_compile(re_, PCRE2_JIT_COMPLETE);
  }
}

std::string Regex::get_error_message() const {
  std::ostringstream msg;
  msg << "PCRE2 compilation failed at offset " << error_offset_ << ": "
      << error_message(error_number_);
  return msg.str();
}

// return compiled regex
const pcre2_code *Regex::get_pcre2_code() const { return re_; }

int Regex::consume(
    std::string_view *subj,  // the string (view) agains we are matching
    Match *M,                // where to store the results of the match
    uint32_t options         // search options
) const {
  int success = find(*subj, M, 0, options | PCRE2_ANCHORED);
  if (success > 0) {
    subj->remove_prefix((*M)[0].size());
  }
  return success;
}

int Regex::find(
    std::string_view subj,  // the string (view) agains we are matching
    Match *M,               // where to store the results of the match
    size_t start,           // where to start searching in the string
    uint32_t options        // search options
) const {
  if (start > subj.size()) {
    throw std::out_of_range("Regex::find start beyond subject");
  }
  int rc = pcre2_match(re_,                     /* the compiled pattern */
                       PCRE2_SPTR(subj.data()), /* the subject string */
                       subj.size(),             /* the length of the subject */
                       start,                   /* where to start */
                       options,                 /* options */
                       M->match_data, /* block for storing the result */
                       nullptr);      /* use default match context */
  if (rc < 0 && rc != PCRE2_ERROR_NOMATCH) {
    throw std::runtime_error("PCRE2 matching /" + pattern_ +
                             "/ failed: " + error_message(rc));
  }
  M->data = rc > 0 ? subj.data() : nullptr;
  M->num_matched_groups = rc;
  return rc;  // returns the number of matched groups
}

Ranges Regex::matches(std::string_view subj) const {
  Match match(re_);
  Ranges ranges;
  size_t start = 0;
  while (start <= subj.size() && find(subj, &match, start) > 0) {
    Range range = match.range(0);
    ranges.push_back(range);
    if (range.end > range.begin) {
      start = range.end;
    } else if (range.end < subj.size()) {
      // Empty match, step over one character to make progress.
      start = range.end + utf8_step(subj, range.end);
    } else {
      break;
    }
  }
  return ranges;
}

std::string Regex::replace(std::string_view subj,
                           const std::string &replacement) const {
  Match match(re_);
  constexpr uint32_t kOptions =
      PCRE2_SUBSTITUTE_GLOBAL | PCRE2_SUBSTITUTE_OVERFLOW_LENGTH;

  std::string output(subj.size() + 1, '\0');
  PCRE2_SIZE length = output.size();
  auto substitute = [&]() {
    return pcre2_substitute(
        re_, PCRE2_SPTR(subj.data()), subj.size(), 0, kOptions,
        match.match_data, nullptr, PCRE2_SPTR(replacement.data()),
        replacement.size(),
        reinterpret_cast<PCRE2_UCHAR *>(output.data()), &length);
  };

  int rc = substitute();
  if (rc == PCRE2_ERROR_NOMEMORY) {
    // length now holds the size required, including the terminating zero.
    output.resize(length);
    rc = substitute();
  }
  if (rc < 0) {
    throw std::runtime_error("PCRE2 substitution /" + pattern_ +
                             "/ failed: " + error_message(rc));
  }
  output.resize(length);
  return output;
}

Regex::~Regex() { pcre2_code_free(re_); }

Match::Match(const Regex &re) : Match(re.get_pcre2_code()) {}

Match::Match(const pcre2_code *re)
    : match_data(pcre2_match_data_create_from_pattern(re, nullptr)) {}

Match::~Match() { pcre2_match_data_free(match_data); }

Range Match::range(int i) const {
  PCRE2_SIZE *o = pcre2_get_ovector_pointer(match_data);
  if (i >= num_matched_groups || o[2 * i] == PCRE2_UNSET) {
    return Range{0, 0};
  }
  return Range{o[2 * i], o[2 * i + 1]};
}

std::string_view Match::operator[](int i) const {
  Range r = range(i);
  if (data == nullptr) {
    return std::string_view();
  }
  return std::string_view(data + r.begin, r.size());
}

}  // namespace shard

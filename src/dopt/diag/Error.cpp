#include "dopt/diag/Error.hpp"

namespace dopt {

Error Error::not_found(std::string_view token) {
  return Error(ErrorKind::NotFound,
               fmt::format("no option matched `{}`", token));
}

Error Error::missing_value(std::string_view hint, Uid uid) {
  return Error(ErrorKind::MissingValue,
               fmt::format("option `{}` requires an argument", hint), uid);
}

Error Error::invalid_value(std::string_view hint, std::string_view raw,
                           Uid uid) {
  return Error(ErrorKind::InvalidValue,
               fmt::format("invalid value `{}` for option `{}`", raw, hint),
               uid);
}

Error Error::illegal_deactivation(std::string_view hint, Uid uid) {
  return Error(ErrorKind::IllegalDeactivation,
               fmt::format("option `{}` can not be deactivated", hint), uid);
}

Error Error::option_required(std::string_view names) {
  return Error(ErrorKind::OptionRequired,
               fmt::format("option `{}` is force required", names));
}

Error Error::pos_required(std::string_view names) {
  return Error(ErrorKind::PosRequired,
               fmt::format("positional `{}` is force required", names));
}

Error Error::cmd_required(std::string_view names) {
  return Error(ErrorKind::CmdRequired,
               fmt::format("one of the commands `{}` is required", names));
}

Error Error::failure(std::string msg) {
  return Error(ErrorKind::Failure, msg);
}

Error Error::invalid_create_string(std::string_view str,
                                   std::string_view reason) {
  return Error(ErrorKind::InvalidCreateString,
               fmt::format("invalid create string `{}`: {}", str, reason));
}

Error Error::invalid_index(std::string_view str, std::string_view reason) {
  return Error(ErrorKind::InvalidIndex,
               fmt::format("invalid index `{}`: {}", str, reason));
}

Error Error::invalid_uid(Uid uid) {
  return Error(ErrorKind::InvalidUid, fmt::format("invalid uid {}", uid),
               uid);
}

Error Error::value_not_found(Uid uid) {
  return Error(ErrorKind::ValueNotFound,
               fmt::format("option {} holds no value", uid), uid);
}

Error Error::value_type_mismatch(Uid uid, std::string_view stored) {
  return Error(ErrorKind::ValueTypeMismatch,
               fmt::format("requested type does not match the `{}` value "
                           "of option {}",
                           stored, uid),
               uid);
}

Error Error::unexpected_pos_if_has_cmd(Uid uid) {
  return Error(ErrorKind::UnexpectedPosIfHasCmd,
               fmt::format("force positional {} at index 1 conflicts with a "
                           "command",
                           uid),
               uid);
}

Error Error::duplicate_sub_parser(std::string_view name) {
  return Error(ErrorKind::DuplicateSubParser,
               fmt::format("sub parser `{}` already exists", name));
}

Error Error::sub_parser_not_found(std::string_view name) {
  return Error(ErrorKind::SubParserNotFound,
               fmt::format("sub parser `{}` not found", name));
}

bool Error::is_failure() const noexcept {
  switch (m_kind) {
  case ErrorKind::NotFound:
  case ErrorKind::MissingValue:
  case ErrorKind::InvalidValue:
  case ErrorKind::IllegalDeactivation:
  case ErrorKind::OptionRequired:
  case ErrorKind::PosRequired:
  case ErrorKind::CmdRequired:
  case ErrorKind::Failure:
    return true;
  default:
    return false;
  }
}

bool Error::is_recoverable() const noexcept {
  return m_kind == ErrorKind::MissingValue ||
         m_kind == ErrorKind::InvalidValue || m_kind == ErrorKind::Failure;
}

Error &Error::caused_by(Error cause) {
  if (m_cause == nullptr) {
    m_cause = std::make_shared<const Error>(std::move(cause));
    return *this;
  }
  // append to the end of the existing chain
  Error copy = *m_cause;
  copy.caused_by(std::move(cause));
  m_cause = std::make_shared<const Error>(std::move(copy));
  return *this;
}

std::string Error::chain() const {
  std::string out = what();
  for (const Error *it = cause(); it != nullptr; it = it->cause()) {
    out += fmt::format(": caused by: {}", it->what());
  }
  return out;
}

} // namespace dopt

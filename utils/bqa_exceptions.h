#ifndef BQA_EXCEPTIONS_H
#define BQA_EXCEPTIONS_H

#include <exception>
#include <string>

// ============================================================================
// BBOXQA EXCEPTION HIERARCHY
// ============================================================================
//
// bqa_exception (base)
// ├── bqa_schema_error      required field or nested sequence missing (fatal)
// ├── bqa_json_error        malformed JSON in a page record or service reply
// ├── bqa_xml_error         malformed pagination XML
// ├── bqa_io_error          input/output file cannot be opened (fatal)
// ├── bqa_config_error      invalid command line (usage)
// └── bqa_dimension_error   image dimensions unavailable (absorbed per page)
//
// ============================================================================

namespace bqa {

class bqa_exception : public std::exception {
protected:
  std::string message_;

public:
  explicit bqa_exception(const std::string& message) : message_(message) {}
  virtual ~bqa_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// ============================================================================
// SCHEMA ERRORS
// ============================================================================

class bqa_schema_error : public bqa_exception {
private:
  std::string field_;

public:
  bqa_schema_error(const std::string& field, const std::string& context)
    : bqa_exception("Schema violation: missing '" + field + "' in " + context),
      field_(field) {}

  const std::string& get_field() const { return field_; }
};

class bqa_json_error : public bqa_exception {
public:
  using bqa_exception::bqa_exception;
};

class bqa_xml_error : public bqa_exception {
public:
  using bqa_exception::bqa_exception;
};

// ============================================================================
// I/O AND CONFIGURATION ERRORS
// ============================================================================

class bqa_io_error : public bqa_exception {
private:
  std::string path_;

public:
  bqa_io_error(const std::string& message, const std::string& path)
    : bqa_exception(message + ": " + path), path_(path) {}

  const std::string& get_path() const { return path_; }
};

class bqa_config_error : public bqa_exception {
public:
  using bqa_exception::bqa_exception;
};

// ============================================================================
// DIMENSION PROVIDER ERRORS
// ============================================================================

class bqa_dimension_error : public bqa_exception {
private:
  std::string image_ref_;
  int attempts_;

public:
  bqa_dimension_error(const std::string& message, const std::string& image_ref, int attempts = 1)
    : bqa_exception(message), image_ref_(image_ref), attempts_(attempts) {}

  const std::string& get_image_ref() const { return image_ref_; }
  int get_attempts() const { return attempts_; }
};

} // namespace bqa

#endif // BQA_EXCEPTIONS_H

#pragma once

#include <cstdint>
#include <string>

// Creates the local artifact that a run uploads. An artifact that already has the
// requested length is left untouched.
class content_generator {
public:
  content_generator(std::string work_dir, uint64_t seed);

  // Returns true when the artifact was (re)written, false when it was reused.
  // Throws io_failure when the artifact cannot be written.
  bool ensure_content(const std::string& name, int64_t size);

  std::string artifact_path(const std::string& name) const;

private:
  std::string m_work_dir;
  uint64_t m_seed;
};

#include "content_generator.hh"

#include <algorithm>
#include <fstream>
#include <vector>

#include "constants.hh"
#include "utilities.hh"

content_generator::content_generator(std::string work_dir, uint64_t seed)
    : m_work_dir(std::move(work_dir)), m_seed(seed)
{
}

std::string content_generator::artifact_path(const std::string& name) const
{
  return join_path(m_work_dir, name);
}

bool content_generator::ensure_content(const std::string& name, int64_t size)
{
  const std::string path = artifact_path(name);

  auto existing_size = get_file_size(path);
  if (existing_size.HasValue() && existing_size.Value() == size)
  {
    spdlog::debug("{} already has {} bytes, reusing it", path, size);
    return false;
  }

  std::vector<uint8_t> block(content_block_size);
  fill_text_buffer(block.data(), block.size(), m_seed);

  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout)
  {
    throw io_failure("failed to create " + path);
  }
  int64_t generated_size = 0;
  while (generated_size < size)
  {
    auto chunk_size = std::min<int64_t>(size - generated_size, block.size());
    fout.write(reinterpret_cast<const char*>(block.data()), chunk_size);
    if (!fout)
    {
      throw io_failure("failed to write " + path);
    }
    generated_size += chunk_size;
  }
  fout.close();
  if (!fout)
  {
    throw io_failure("failed to write " + path);
  }
  spdlog::debug("generated {} bytes into {}", size, path);
  return true;
}

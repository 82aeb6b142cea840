#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

class MappedFile {
public:
  explicit MappedFile(int fd) : fd_(fd) {}
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() {
    if (data_ != nullptr) ::munmap(data_, size_);
    if (fd_ >= 0) ::close(fd_);
  }
  bool valid() const { return fd_ >= 0; }
  bool map(size_t n) {
    void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mem == MAP_FAILED) return false;
    data_ = mem;
    size_ = n;
    return true;
  }
  int fd() const { return fd_; }
  const char* data() const { return static_cast<const char*>(data_); }
private:
  int fd_;
  void* data_ = nullptr;
  size_t size_ = 0;
};

static void push_line(std::vector<std::string>& out, const char* data, size_t start, size_t end) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  MappedFile f(::open(path.string().c_str(), O_RDONLY));
  if (!f.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(f.fd(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(""); msg = std::string("opened ") + path.string(); return true; }
  if (!f.map(n)) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = f.data();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      push_line(out_lines, data, start, i);
      start = i + 1;
    }
  }
  if (start < n) push_line(out_lines, data, start, n);
  msg = std::string("opened ") + path.string();
  return true;
}

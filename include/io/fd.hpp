#pragma once

namespace staticfs {

// Owns a file descriptor and closes it on destruction. Descriptors obtained
// through Borrow() (stdin, stdout) are never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd), owned_(true) {}

    static Fd Borrow(int fd) {
        Fd out(fd);
        out.owned_ = false;
        return out;
    }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }
    bool Owned() const { return owned_; }

    // Gives up ownership without closing.
    int Release();
    void Close();

  private:
    int fd_{-1};
    bool owned_{false};
};

} // namespace staticfs

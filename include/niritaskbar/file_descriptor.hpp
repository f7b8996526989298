#pragma once

#include <utility>

#include <unistd.h>

namespace niritaskbar {

    // Owns a POSIX descriptor and closes it on destruction.
    class FileDescriptor {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() {
            reset();
        }

        FileDescriptor(const FileDescriptor&)            = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
        FileDescriptor& operator=(FileDescriptor&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        int get() const {
            return fd_;
        }
        explicit operator bool() const {
            return fd_ >= 0;
        }

        int release() {
            return std::exchange(fd_, -1);
        }

        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

      private:
        int fd_ = -1;
    };

}

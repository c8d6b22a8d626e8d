#include "common/cancellation.hpp"
#include <string.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include "common/exceptions.hpp"

namespace pysandbox {
using namespace std;

cancellation_token::cancellation_token() : cancelled(false) {
    efd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (efd < 0) throw sandbox_error(string("unable to create eventfd: ") + strerror(errno));
}

cancellation_token::~cancellation_token() {
    close(efd);
}

void cancellation_token::cancel() noexcept {
    cancelled.store(true);
    uint64_t one = 1;
    // the counter is never read back, so the descriptor stays readable
    while (write(efd, &one, sizeof(one)) < 0 && errno == EINTR) {
    }
}

bool cancellation_token::is_cancelled() const noexcept {
    return cancelled.load();
}

int cancellation_token::fd() const noexcept {
    return efd;
}

}  // namespace pysandbox

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <net/if.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <linux/if_tun.h>
#include "device.hpp"
#include "trace.hpp"

int openTunDevice(const char *name) {
    if(strlen(name) >= IFNAMSIZ) {
        fprintf(stderr, "[Link Error] interface name '%s' is too long.\n", name);
        return -1;
    }
    int fd = open("/dev/net/tun", O_RDWR);
    if(fd < 0) {
        fprintf(stderr, "[Link Error] open /dev/net/tun: %s\n", strerror(errno));
        return -1;
    }
    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    ifr.ifr_flags = IFF_TUN | IFF_NO_PI;
    strncpy(ifr.ifr_name, name, IFNAMSIZ - 1);
    if(ioctl(fd, TUNSETIFF, &ifr) < 0) {
        fprintf(stderr, "[Link Error] TUNSETIFF '%s': %s\n", name, strerror(errno));
        close(fd);
        return -1;
    }
    fprintf(stderr, "Opened TUN device '%s'.\n", ifr.ifr_name);
    return fd;
}

NetDevice::NetDevice(int fd, std::size_t capacity)
    : fd(fd), wake_fd(eventfd(0, EFD_CLOEXEC)), is_bound(false),
      incoming(capacity), outgoing(capacity) {
    if(wake_fd < 0) {
        fprintf(stderr, "[Link Error] eventfd: %s\n", strerror(errno));
    }
}

NetDevice::~NetDevice() {
    shutdown();
    if(wake_fd >= 0) close(wake_fd);
    if(fd >= 0) close(fd);
}

void NetDevice::setTrace(std::shared_ptr<PacketTrace> new_trace) {
    trace = std::move(new_trace);
}

int NetDevice::bind() {
    if(is_bound || incoming.closed()) {
        fprintf(stderr, "[Link Error] bind: device already bound or shut down.\n");
        return -1;
    }
    if(fd < 0 || wake_fd < 0) {
        fprintf(stderr, "[Link Error] bind: invalid device.\n");
        return -1;
    }
    is_bound = true;
    thread_reader = std::thread(&NetDevice::readerWorker, this);
    thread_writer = std::thread(&NetDevice::writerWorker, this);
    return 0;
}

std::optional<Packet> NetDevice::read() {
    return incoming.pop();
}

bool NetDevice::write(Packet packet) {
    return outgoing.push(std::move(packet));
}

void NetDevice::shutdown() {
    if(wake_fd >= 0) {
        uint64_t one = 1;
        if(::write(wake_fd, &one, sizeof(one)) < 0) {
            fprintf(stderr, "[Link Error] failed to wake reader: %s\n", strerror(errno));
        }
    }
    incoming.close();
    outgoing.close();
    if(thread_reader.joinable()) thread_reader.join();
    if(thread_writer.joinable()) thread_writer.join();
}

// An I/O error ends the thread: the device is local, so a failure means
// misconfiguration. Closing the queue lets every stage above wind down.
void NetDevice::readerWorker() {
    uint8_t buf[TUN_BUFFER_SIZE];
    struct pollfd fds[2] = {{fd, POLLIN, 0}, {wake_fd, POLLIN, 0}};
    while(true) {
        int res = poll(fds, 2, -1);
        if(res < 0) {
            if(errno == EINTR) continue;
            fprintf(stderr, "[Link Error] poll: %s\n", strerror(errno));
            break;
        }
        if(fds[1].revents) break;   // shutdown
        if(fds[0].revents & (POLLERR | POLLNVAL)) {
            fprintf(stderr, "[Link Error] device fd reported an error.\n");
            break;
        }
        ssize_t len = ::read(fd, buf, sizeof(buf));
        if(len < 0) {
            if(errno == EINTR || errno == EAGAIN) continue;
            fprintf(stderr, "[Link Error] failed to read from device: %s\n", strerror(errno));
            break;
        }
        if(len == 0) {
            fprintf(stderr, "[Link Error] device reached EOF.\n");
            break;
        }
        Packet packet{std::vector<uint8_t>(buf, buf + len)};
        if(trace) trace->record(packet);
        if(!incoming.push(std::move(packet))) break;
    }
    incoming.close();
    fprintf(stderr, "Device reader stopped.\n");
}

void NetDevice::writerWorker() {
    while(std::optional<Packet> packet = outgoing.pop()) {
        if(trace) trace->record(*packet);
        ssize_t len = ::write(fd, packet->data.data(), packet->data.size());
        if(len < 0) {
            fprintf(stderr, "[Link Error] failed to write to device: %s\n", strerror(errno));
            break;
        }
        if((size_t)len != packet->data.size()) {
            fprintf(stderr, "[Link Error] short write to device: %zd of %zu bytes\n",
                    len, packet->data.size());
            break;
        }
    }
    outgoing.close();
    fprintf(stderr, "Device writer stopped.\n");
}


#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <net/if.h>
#include <linux/can.h>
#include <linux/can/raw.h>

#include "cantypes/CanDriverSocket.hh"

#define DODEBUG 0
#if DODEBUG
#define ONDEBUG(x) x
#else
#define ONDEBUG(x)
#endif

namespace CanTypesN {

  CanDriverSocketC::CanDriverSocketC()
  {}

  CanDriverSocketC::~CanDriverSocketC()
  {
    if(m_fd >= 0)
      Close();
  }

  bool CanDriverSocketC::Open(const std::string &name,bool canFd)
  {
    if(m_fd >= 0) {
      m_log->info("Interface '{}' already open. ",m_name);
      return false;
    }
    if(name.size() >= IFNAMSIZ) {
      m_log->error("Interface name '{}' too long. ",name);
      return false;
    }

    m_name = name;
    m_canFd = canFd;
    m_log->info("Opening: '{}' CAN-FD:{} ",name,canFd);

    int fd = socket(PF_CAN,SOCK_RAW,CAN_RAW);
    if(fd < 0) {
      m_log->error("Failed to create CAN socket. Error:{}, {} ",errno,strerror(errno));
      return false;
    }

    struct ifreq ifr;
    memset(&ifr,0,sizeof(ifr));
    strncpy(ifr.ifr_name,name.c_str(),IFNAMSIZ-1);
    if(ioctl(fd,SIOCGIFINDEX,&ifr) < 0) {
      m_log->error("Failed to find interface '{}' Error:{}, {} ",name,errno,strerror(errno));
      close(fd);
      return false;
    }

    if(canFd) {
      int enable = 1;
      if(setsockopt(fd,SOL_CAN_RAW,CAN_RAW_FD_FRAMES,&enable,sizeof(enable)) < 0) {
        m_log->error("Interface '{}' doesn't support CAN-FD. Error:{}, {} ",name,errno,strerror(errno));
        close(fd);
        return false;
      }
    }

    struct sockaddr_can addr;
    memset(&addr,0,sizeof(addr));
    addr.can_family = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;
    if(bind(fd,(struct sockaddr *) &addr,sizeof(addr)) < 0) {
      m_log->error("Failed to bind to '{}' Error:{}, {} ",name,errno,strerror(errno));
      close(fd);
      return false;
    }

    int flags = fcntl(fd,F_GETFL,0);
    if(flags < 0 || fcntl(fd,F_SETFL,flags | O_NONBLOCK) < 0) {
      m_log->error("Failed to set non blocking mode on '{}' ",name);
      close(fd);
      return false;
    }

    m_fd = fd;
    m_log->debug("Interface opened ok '{}' ",name);
    return true;
  }

  void CanDriverSocketC::Close()
  {
    m_log->debug("Close called.");
    std::lock_guard<std::mutex> lock(m_accessTx);
    if(m_fd >= 0)
      close(m_fd);
    m_fd = -1;
  }

  bool CanDriverSocketC::IsReady() const
  {
    return m_fd >= 0;
  }

  bool CanDriverSocketC::Transmit(const CanMessageC &msg)
  {
    std::lock_guard<std::mutex> lock(m_accessTx);
    if(m_fd < 0) {
      m_log->error("Transmit on closed interface '{}' ",m_name);
      return false;
    }

    IdC id = msg.Id();
    canid_t canId = id.AsRaw();
    if(id.Type() != IT_Can2A) {
      canId &= CAN_EFF_MASK;
      canId |= CAN_EFF_FLAG;
    }
    if(msg.IsErrorFrame())
      canId |= CAN_ERR_FLAG;

    ssize_t n = 0;
    size_t expected = 0;
    if(msg.IsCanFd()) {
      if(!m_canFd) {
        m_log->warn("CAN-FD frame not supported on '{}' ",m_name);
        return false;
      }
      struct canfd_frame frame;
      memset(&frame,0,sizeof(frame));
      frame.can_id = canId;
      frame.len = (uint8_t) msg.Length();
      if(msg.IsBitrateSwitch())
        frame.flags |= CANFD_BRS;
      if(msg.IsEsi())
        frame.flags |= CANFD_ESI;
      memcpy(frame.data,msg.Data().data(),Min(msg.Data().size(),sizeof(frame.data)));
      expected = CANFD_MTU;
      n = write(m_fd,&frame,expected);
    } else {
      struct can_frame frame;
      memset(&frame,0,sizeof(frame));
      if(msg.IsRemote())
        canId |= CAN_RTR_FLAG;
      frame.can_id = canId;
      frame.can_dlc = (uint8_t) msg.Length();
      if(!msg.IsRemote())
        memcpy(frame.data,msg.Data().data(),Min(msg.Data().size(),sizeof(frame.data)));
      expected = CAN_MTU;
      n = write(m_fd,&frame,expected);
    }
    if(n < 0) {
      m_log->error("Failed to write frame to '{}' Error:{}, {} ",m_name,errno,strerror(errno));
      return false;
    }
    if((size_t) n != expected) {
      m_log->error("Short write to '{}' {} of {} bytes ",m_name,n,expected);
      return false;
    }
    return true;
  }

  bool CanDriverSocketC::Receive(std::vector<CanMessageC> &frames,int timeoutMs)
  {
    int theFd = m_fd;
    if(theFd < 0)
      return false;

    fd_set localFds;
    FD_ZERO(&localFds);
    FD_SET(theFd,&localFds);
    struct timeval timeout;
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;
    int x = select(theFd+1,&localFds,0,0,&timeout);
    if(x < 0) {
      if(errno == EINTR)
        return true;
      m_log->error("Failed to select on '{}' Error:{}, {} ",m_name,errno,strerror(errno));
      return false;
    }
    if(x == 0)
      return true;

    // Drain everything that is available.
    while(true) {
      struct canfd_frame frame;
      ssize_t n = read(theFd,&frame,sizeof(frame));
      if(n < 0) {
        if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
          break;
        m_log->error("Failed to read from '{}', device most likely disconnected. Error:{}, {} ",m_name,errno,strerror(errno));
        return false;
      }

      bool isFd = false;
      if(n == CANFD_MTU) {
        isFd = true;
      } else if(n != CAN_MTU) {
        m_log->warn("Unexpected frame size {} from '{}' ",n,m_name);
        continue;
      }

      canid_t canId = frame.can_id;
      bool isExtended = (canId & CAN_EFF_FLAG) != 0;
      uint32_t bits = isExtended ? (canId & CAN_EFF_MASK) : (canId & CAN_SFF_MASK);
      IdC id = isExtended ? IdC(Can2BC(bits)) : IdC(Can2AC((uint16_t) bits));

      CanMessageC msg;
      if(!isFd && (canId & CAN_RTR_FLAG) != 0) {
        CanMessageC::CreateRemote(id,Min((size_t) frame.len,CAN_FRAME_MAX_SIZE),msg);
      } else {
        size_t len = isFd ? Min((size_t) frame.len,CANFD_FRAME_MAX_SIZE) : Min((size_t) frame.len,CAN_FRAME_MAX_SIZE);
        ByteArrayT data(frame.data,frame.data + len);
        if(!CanMessageC::Create(id,data,msg)) {
          m_log->warn("Failed to convert frame from '{}' ",m_name);
          continue;
        }
        if(isFd) {
          msg.SetCanFd(true);
          msg.SetBitrateSwitch((frame.flags & CANFD_BRS) != 0);
          msg.SetEsi((frame.flags & CANFD_ESI) != 0);
        }
      }
      msg.SetErrorFrame((canId & CAN_ERR_FLAG) != 0);
      StampReceived(msg);
      ONDEBUG(m_log->debug("Received {} ",msg.ToString()));
      frames.push_back(msg);
    }
    return true;
  }

}

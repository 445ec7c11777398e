#ifndef CANTYPES_ISOTPFRAME_HEADER
#define CANTYPES_ISOTPFRAME_HEADER 1

#include <string>
#include <vector>
#include "cantypes/IsoTpTypes.hh"
#include "cantypes/CanMessage.hh"

namespace CanTypesN {

  //! Largest payload carried by a single frame.
  size_t IsoTpSingleFrameCapacity(const IsoTpConfigC &config);

  //! One ISO-TP protocol data unit as carried in a CAN frame.

  class CanIsoTpFrameC
  {
  public:
    //! Default constructor, an empty single frame.
    CanIsoTpFrameC()
    {}

    //! Single frame holding the whole payload.
    static CanIsoTpFrameC Single(const ByteArrayT &data);

    //! First frame of a segmented payload.
    //! \param length total length of the payload.
    //! \param data bytes carried in this frame.
    static CanIsoTpFrameC First(uint32_t length,const ByteArrayT &data);

    //! Consecutive frame, only the low 4 bits of sequence are used.
    static CanIsoTpFrameC Consecutive(uint8_t sequence,const ByteArrayT &data);

    static CanIsoTpFrameC FlowControl(const FlowControlContextC &context);

    //! Flow control frame telling the peer to continue with our block size and separation time.
    static CanIsoTpFrameC DefaultFlowControl(const IsoTpConfigC &config);

    //! Decode the payload of a CAN frame.
    //! Throws ExceptionIsoTpC if the bytes are not a valid frame.
    static CanIsoTpFrameC Decode(const ByteArrayT &data,const IsoTpConfigC &config);

    //! Split a payload into the frames needed to send it.
    //! Throws ExceptionIsoTpC if data is empty or too long for the standard.
    static std::vector<CanIsoTpFrameC> FromData(const ByteArrayT &data,const IsoTpConfigC &config);

    //! Encode as the payload of a CAN frame, padded with the configured byte.
    //! Throws ExceptionIsoTpC if the frame doesn't fit.
    ByteArrayT Encode(const IsoTpConfigC &config) const;

    //! Build a CAN message with the given id.
    //! Returns false if the encoded frame can't be carried in a CAN message.
    bool IntoCanMessage(uint32_t id,const IsoTpConfigC &config,CanMessageC &msg) const;

    IsoTpFrameTypeT Type() const
    { return m_type; }

    //! Payload bytes of single, first and consecutive frames.
    const ByteArrayT &Data() const
    { return m_data; }

    //! Total payload length announced by a first frame.
    uint32_t Length() const
    { return m_length; }

    //! Sequence number of a consecutive frame.
    uint8_t Sequence() const
    { return m_sequence; }

    //! Content of a flow control frame.
    const FlowControlContextC &Context() const
    { return m_context; }

    //! Short description for log messages.
    std::string ToString() const;

  protected:
    IsoTpFrameTypeT m_type = FT_Single;
    ByteArrayT m_data;
    uint32_t m_length = 0;
    uint8_t m_sequence = 0;
    FlowControlContextC m_context;
  };

}

#endif

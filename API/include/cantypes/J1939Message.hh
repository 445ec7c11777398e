#ifndef CANTYPES_J1939MESSAGE_HEADER
#define CANTYPES_J1939MESSAGE_HEADER 1

#include "cantypes/Identifier.hh"

namespace CanTypesN {

  //! 64-bit J1939 NAME field used during address claiming.
  //!
  //! Bit layout from the most significant bit:
  //!   1 arbitrary address capable, 3 industry group, 4 vehicle system instance,
  //!   7 vehicle system, 1 reserved, 8 function, 5 function instance,
  //!   3 ECU instance, 11 manufacturer code, 21 identity number.

  class NameFieldC
  {
  public:
    NameFieldC()
    {}

    explicit NameFieldC(uint64_t bits)
      : m_bits(bits)
    {}

    static NameFieldC FromBits(uint64_t bits)
    { return NameFieldC(bits); }

    //! Parse hex, a parse failure gives 0.
    static NameFieldC FromHex(const std::string &hexStr);

    //! Every 64-bit value is a valid name.
    static bool TryFromBits(uint64_t bits,NameFieldC &name);

    static bool TryFromHex(const std::string &hexStr,NameFieldC &name);

    uint64_t IntoBits() const
    { return m_bits; }

    //! Upper case hex, 16 digits.
    std::string IntoHex() const;

    bool ArbitraryAddressCapable() const
    { return (m_bits >> 63) & 0x1; }

    uint8_t IndustryGroup() const
    { return (m_bits >> 60) & 0x7; }

    uint8_t VehicleSystemInstance() const
    { return (m_bits >> 56) & 0xf; }

    uint8_t VehicleSystem() const
    { return (m_bits >> 49) & 0x7f; }

    bool Reserved() const
    { return (m_bits >> 48) & 0x1; }

    uint8_t Function() const
    { return (m_bits >> 40) & 0xff; }

    uint8_t FunctionInstance() const
    { return (m_bits >> 35) & 0x1f; }

    uint8_t EcuInstance() const
    { return (m_bits >> 32) & 0x7; }

    uint16_t ManufacturerCode() const
    { return (m_bits >> 21) & 0x7ff; }

    uint32_t IdentityNumber() const
    { return m_bits & 0x1fffff; }

    bool operator==(const NameFieldC &other) const
    { return m_bits == other.m_bits; }

    bool operator!=(const NameFieldC &other) const
    { return m_bits != other.m_bits; }

  protected:
    uint64_t m_bits = 0;
  };

  //! 8 bytes of generic J1939 data, byte 0 is the most significant.

  class DataFieldC
  {
  public:
    DataFieldC()
    {}

    explicit DataFieldC(uint64_t bits)
      : m_bits(bits)
    {}

    static DataFieldC FromBits(uint64_t bits)
    { return DataFieldC(bits); }

    //! Parse hex, a parse failure gives 0.
    static DataFieldC FromHex(const std::string &hexStr);

    static bool TryFromBits(uint64_t bits,DataFieldC &data);

    static bool TryFromHex(const std::string &hexStr,DataFieldC &data);

    //! Build from up to 8 bytes, missing bytes are 0xFF as J1939 requires.
    static bool FromBytes(const ByteArrayT &data,DataFieldC &field);

    uint64_t IntoBits() const
    { return m_bits; }

    //! Upper case hex, 16 digits.
    std::string IntoHex() const;

    //! Access a byte, index 0 to 7.
    uint8_t Byte(int index) const
    { return (m_bits >> (8 * (7 - index))) & 0xff; }

    //! Data as bytes in transmission order.
    ByteArrayT IntoBytes() const;

    bool operator==(const DataFieldC &other) const
    { return m_bits == other.m_bits; }

    bool operator!=(const DataFieldC &other) const
    { return m_bits != other.m_bits; }

  protected:
    uint64_t m_bits = 0;
  };

  enum J1939PduTypeT {
    PT_Name = 0,
    PT_Data = 1
  };

  //! Payload of a J1939 message, either a NAME or a data field.

  class J1939PduC
  {
  public:
    //! Default is an empty data field.
    J1939PduC()
    {}

    J1939PduC(const NameFieldC &name)
      : m_type(PT_Name),
        m_bits(name.IntoBits())
    {}

    J1939PduC(const DataFieldC &data)
      : m_type(PT_Data),
        m_bits(data.IntoBits())
    {}

    J1939PduTypeT Type() const
    { return m_type; }

    uint64_t IntoBits() const
    { return m_bits; }

    NameFieldC AsName() const
    { return NameFieldC(m_bits); }

    DataFieldC AsData() const
    { return DataFieldC(m_bits); }

    bool operator==(const J1939PduC &other) const
    { return m_type == other.m_type && m_bits == other.m_bits; }

    bool operator!=(const J1939PduC &other) const
    { return !operator==(other); }

  protected:
    J1939PduTypeT m_type = PT_Data;
    uint64_t m_bits = 0;
  };

  //! A J1939 message, an extended identifier and a 64-bit payload.

  class J1939MessageC
  {
  public:
    J1939MessageC()
    {}

    //! Build from parts.
    //! Standard ids are rejected, CAN 2.0B ids are reinterpreted as J1939.
    static bool FromParts(const IdC &id,const J1939PduC &pdu,J1939MessageC &msg);

    //! Split into parts.
    void IntoParts(IdC &id,J1939PduC &pdu) const
    {
      id = m_id;
      pdu = m_pdu;
    }

    //! Build from raw values without validation.
    static J1939MessageC FromBits(uint32_t id,uint64_t pdu,J1939PduTypeT pduType);

    //! Build from hex strings, parse failures give zero values.
    static J1939MessageC FromHex(const std::string &hexId,const std::string &hexPdu,J1939PduTypeT pduType);

    //! Build from raw values.
    static bool TryFromBits(uint32_t id,uint64_t pdu,J1939PduTypeT pduType,J1939MessageC &msg);

    //! Build from hex strings, fails if either string can't be parsed.
    static bool TryFromHex(const std::string &hexId,const std::string &hexPdu,J1939PduTypeT pduType,J1939MessageC &msg);

    //! Identifier of the message.
    const IdC &Id() const
    { return m_id; }

    //! Payload of the message.
    const J1939PduC &Pdu() const
    { return m_pdu; }

    bool operator==(const J1939MessageC &other) const
    { return m_id == other.m_id && m_pdu == other.m_pdu; }

  protected:
    J1939MessageC(const IdC &id,const J1939PduC &pdu)
      : m_id(id),
        m_pdu(pdu)
    {}

    IdC m_id = IdC(J1939IdC());
    J1939PduC m_pdu;
  };

}

#endif

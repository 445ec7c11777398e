#ifndef CANTYPES_IDENTIFIER_HEADER
#define CANTYPES_IDENTIFIER_HEADER 1

#include <string>
#include <cstdint>
#include "cantypes/Types.hh"
#include "cantypes/J1939Address.hh"

namespace CanTypesN {

  //! 11-bit standard CAN 2.0A identifier.

  class Can2AC
  {
  public:
    Can2AC()
    {}

    //! Wrap bits without checking them.
    explicit Can2AC(uint16_t bits)
      : m_bits(bits)
    {}

    //! Create from bits without validation.
    static Can2AC FromBits(uint16_t bits)
    { return Can2AC(bits); }

    //! Create from a base-16 string, returns 0 if the string can't be parsed.
    static Can2AC FromHex(const std::string &hexStr);

    //! Create from bits, fails if the value is larger than 11 bits.
    static bool TryFromBits(uint16_t bits,Can2AC &id);

    //! Create from a base-16 string, fails if it can't be parsed or is out of range.
    static bool TryFromHex(const std::string &hexStr,Can2AC &id);

    //! Access raw bits.
    uint16_t IntoBits() const
    { return m_bits; }

    //! Upper case hex, 3 digits.
    std::string IntoHex() const;

    bool operator==(const Can2AC &other) const
    { return m_bits == other.m_bits; }

    bool operator!=(const Can2AC &other) const
    { return m_bits != other.m_bits; }

    bool operator<(const Can2AC &other) const
    { return m_bits < other.m_bits; }

  protected:
    uint16_t m_bits = 0;
  };

  //! 29-bit extended CAN 2.0B identifier.

  class Can2BC
  {
  public:
    Can2BC()
    {}

    explicit Can2BC(uint32_t bits)
      : m_bits(bits)
    {}

    //! Create from bits without validation.
    static Can2BC FromBits(uint32_t bits)
    { return Can2BC(bits); }

    //! Create from a base-16 string, returns 0 if the string can't be parsed.
    static Can2BC FromHex(const std::string &hexStr);

    //! Create from bits, fails if the value is larger than 29 bits.
    static bool TryFromBits(uint32_t bits,Can2BC &id);

    //! Create from a base-16 string, fails if it can't be parsed or is out of range.
    static bool TryFromHex(const std::string &hexStr,Can2BC &id);

    //! Access raw bits.
    uint32_t IntoBits() const
    { return m_bits; }

    //! Upper case hex, 8 digits.
    std::string IntoHex() const;

    bool operator==(const Can2BC &other) const
    { return m_bits == other.m_bits; }

    bool operator!=(const Can2BC &other) const
    { return m_bits != other.m_bits; }

    bool operator<(const Can2BC &other) const
    { return m_bits < other.m_bits; }

  protected:
    uint32_t m_bits = 0;
  };

  //! 29-bit J1939 identifier.
  //!
  //! Bit layout from the most significant bit:
  //!   3 unused, 3 priority, 1 reserved, 1 data page,
  //!   8 PDU format, 8 PDU specific, 8 source address.

  class J1939IdC
  {
  public:
    J1939IdC()
    {}

    explicit J1939IdC(uint32_t bits)
      : m_bits(bits)
    {}

    //! Create from bits without validation.
    static J1939IdC FromBits(uint32_t bits)
    { return J1939IdC(bits); }

    //! Create from a base-16 string, returns 0 if the string can't be parsed.
    static J1939IdC FromHex(const std::string &hexStr);

    //! Create from bits, fails if the value is larger than 29 bits.
    static bool TryFromBits(uint32_t bits,J1939IdC &id);

    //! Create from a base-16 string, fails if it can't be parsed or is out of range.
    static bool TryFromHex(const std::string &hexStr,J1939IdC &id);

    //! Construct from individual fields.
    //! Fails if priority is greater than 7.
    static bool FromRawParts(
        uint8_t priority,
        bool reserved,
        bool dataPage,
        uint8_t pduFormat,
        uint8_t pduSpecific,
        uint8_t sourceAddress,
        J1939IdC &id
        );

    //! Access raw bits.
    uint32_t IntoBits() const
    { return m_bits; }

    //! Upper case hex, 8 digits.
    std::string IntoHex() const;

    //! Priority, 0 is the highest.
    uint8_t Priority() const
    { return (m_bits >> 26) & 0x7; }

    //! Reserved bit, also known as extended data page.
    bool Reserved() const
    { return (m_bits >> 25) & 0x1; }

    //! Data page bit.
    bool DataPage() const
    { return (m_bits >> 24) & 0x1; }

    //! PDU format byte.
    uint8_t PduFormat() const
    { return (m_bits >> 16) & 0xff; }

    //! PDU specific byte.
    uint8_t PduSpecific() const
    { return (m_bits >> 8) & 0xff; }

    //! Source address field.
    SourceAddressC SourceAddress() const
    { return SourceAddressC(m_bits & 0xff); }

    //! PDU1 format messages are peer to peer and carry a destination address.
    bool IsPdu1() const
    { return PduFormat() < 240; }

    //! Destination address, only set for PDU1 format messages.
    DestinationAddressC DestinationAddress() const;

    //! Parameter group number.
    uint32_t Pgn() const;

    bool operator==(const J1939IdC &other) const
    { return m_bits == other.m_bits; }

    bool operator!=(const J1939IdC &other) const
    { return m_bits != other.m_bits; }

    bool operator<(const J1939IdC &other) const
    { return m_bits < other.m_bits; }

  protected:
    uint32_t m_bits = 0;
  };

  enum IdTypeT {
    IT_Can2A = 0,
    IT_Can2B = 1,
    IT_J1939 = 2
  };

  //! Any CAN identifier.

  class IdC
  {
  public:
    //! Default is standard id 0.
    IdC()
    {}

    IdC(const Can2AC &id)
      : m_type(IT_Can2A),
        m_bits(id.IntoBits())
    {}

    IdC(const Can2BC &id)
      : m_type(IT_Can2B),
        m_bits(id.IntoBits())
    {}

    IdC(const J1939IdC &id)
      : m_type(IT_J1939),
        m_bits(id.IntoBits())
    {}

    //! Standard when bits fit in 11 bits and forceExtended is false, otherwise extended.
    static IdC FromBits(uint32_t bits,bool forceExtended = false);

    //! Parse hex, a parse failure gives id 0.
    static IdC FromHex(const std::string &hexStr,bool forceExtended = false);

    //! Parse hex, fails if the string can't be parsed or exceeds 29 bits.
    static bool TryFromHex(const std::string &hexStr,bool forceExtended,IdC &id);

    //! Type of identifier.
    IdTypeT Type() const
    { return m_type; }

    //! Identifier as raw 32-bit value.
    uint32_t AsRaw() const
    { return m_bits; }

    //! Base id, extended ids are shifted down to their top 11 bits.
    IdC StandardId() const;

    //! Does the identifier need the extended frame format ?
    bool IsExtended() const;

    //! Access as standard id.
    Can2AC AsCan2A() const
    { return Can2AC((uint16_t) m_bits); }

    //! Access as extended id.
    Can2BC AsCan2B() const
    { return Can2BC(m_bits); }

    //! Access as J1939 id.
    J1939IdC AsJ1939() const
    { return J1939IdC(m_bits); }

    //! Hex representation of the underlying id.
    std::string IntoHex() const;

    bool operator==(const IdC &other) const
    { return m_type == other.m_type && m_bits == other.m_bits; }

    bool operator!=(const IdC &other) const
    { return !operator==(other); }

    bool operator<(const IdC &other) const
    {
      if(m_type != other.m_type)
        return m_type < other.m_type;
      return m_bits < other.m_bits;
    }

  protected:
    IdTypeT m_type = IT_Can2A;
    uint32_t m_bits = 0;
  };

}

#endif

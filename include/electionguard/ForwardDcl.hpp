/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_FORWARD_DECL_HPP
#define ELECTIONGUARD_FORWARD_DECL_HPP

namespace electionguard {

class BigInteger;
class CoercionRegistry;
class DateTime;
class Document;
class ElementModP;
class ElementModQ;
class Exception;
class MalformedBlockError;
class PaddedBlock;
class ParseError;
class SerializationContext;
class TruncationError;
class UnsupportedTypeError;
template<typename T, typename Enable = void> struct Codec;

}

#endif

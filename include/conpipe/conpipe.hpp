#pragma once

// Conpipe - relay a console to one remote peer
// Two transports: Stream (TCP, connection-oriented)
//                 Datagram (UDP, connectionless, source-filtered)

// Core types and utilities
#include <conpipe/codec.hpp>
#include <conpipe/common.hpp>
#include <conpipe/endpoint.hpp>
#include <conpipe/errors.hpp>
#include <conpipe/message.hpp>

// Socket primitives
#include <conpipe/datagram/udp.hpp>
#include <conpipe/stream/tcp.hpp>

// Session plumbing
#include <conpipe/forwarder.hpp>
#include <conpipe/handoff.hpp>
#include <conpipe/input.hpp>

// Transports
#include <conpipe/datagram.hpp>
#include <conpipe/stream.hpp>
#include <conpipe/transport.hpp>

// Forwarding driver
#include <conpipe/bridge.hpp>
#include <conpipe/config.hpp>

// All types are in the conpipe:: namespace
// Available types:
//   - conpipe::Message, conpipe::Category, conpipe::Frame (dp::Vector<dp::u8>)
//   - conpipe::Endpoint, conpipe::Envelope
//   - conpipe::TcpSocket, conpipe::UdpSocket
//   - conpipe::StreamTransport, conpipe::DatagramTransport, conpipe::Transport (variant)
//   - conpipe::HandoffQueue<T>, conpipe::InputBridge, conpipe::Forwarder
//   - conpipe::Bridge, conpipe::Config

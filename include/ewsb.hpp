/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file ewsb.hpp
 * @brief EWSB - Embedded WebSocket Bridge
 *
 * Relays a WebSocket upgrade completed on a shared-memory stream transport
 * (the source) onto an HTTP/1.1-style stream transport (the target) and
 * carries the connection full-duplex afterwards: DATA with WebSocket frame
 * flags one way, WINDOW and RESET the other.
 *
 * Usage:
 *   #include "ewsb.hpp"
 *
 *   ewsb::CorrelationTable correlations;
 *   ewsb::TargetDirectory targets;
 *   targets.add("http#0", http_target);
 *
 *   ewsb::StreamBridge bridge(source, targets, correlations);
 *   bridge.on_source_frame(ewsb::Frame::begin(stream_id, 0, correlation_id));
 *
 * The TCP target endpoint (ewsb/tcp_target.hpp) needs sockpp and lives in
 * the separate ewsb_tcp library.
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef EWSB_HPP_
#define EWSB_HPP_

#include "ewsb/bridge.hpp"
#include "ewsb/buffer_slab.hpp"
#include "ewsb/config.hpp"
#include "ewsb/correlator.hpp"
#include "ewsb/endpoint.hpp"
#include "ewsb/frame.hpp"
#include "ewsb/log.hpp"
#include "ewsb/object_pool.hpp"
#include "ewsb/stream_translator.hpp"
#include "ewsb/vocabulary.hpp"

#endif  // EWSB_HPP_

/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_ZMTP_ENGINE_HPP_INCLUDED__
#define __ZSOCK_ZMTP_ENGINE_HPP_INCLUDED__

#include <boost/asio.hpp>

#include <string>
#include <vector>

#include "core/msg.hpp"
#include "core/options.hpp"
#include "engine/i_engine.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/metadata.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "utils/completion.hpp"
#include "utils/mutex.hpp"

namespace zsock
{
class io_thread_t;
class i_transport;
class frame_decoder_t;
class mechanism_t;

//  ZMTP 3.1 protocol engine on top of a Boost.Asio transport. Every
//  transport operation runs on the I/O thread; the public methods post work
//  there and wait for it where the contract is blocking.

class zmtp_engine_t ZSOCK_FINAL : public i_engine
{
  public:
    zmtp_engine_t (io_thread_t *io_thread_,
                   i_transport *transport_,
                   const options_t &options_);
    ~zmtp_engine_t () ZSOCK_OVERRIDE;

    //  i_engine interface implementation.
    int prepare (int mechanism_,
                 int socket_type_,
                 bool as_server_,
                 const metadata_t *extra_,
                 metadata_t *peer_) ZSOCK_OVERRIDE;
    void recv (channel_t *channel_, uint32_t connection_id_) ZSOCK_OVERRIDE;
    int send_frame (const void *data_, size_t size_) ZSOCK_OVERRIDE;
    void close () ZSOCK_OVERRIDE;

    //  i_pending_op implementation.
    void cancel () ZSOCK_OVERRIDE;

    const std::string &local_address () const { return _local_address; }
    const std::string &remote_address () const { return _remote_address; }

  private:
    //  Size of the inbound buffer.
    enum
    {
        in_batch_size = 8192
    };

    //  Handshake, on the I/O thread.
    void start_handshake ();
    void on_greeting_sent (const boost::system::error_code &ec_);
    void on_greeting_received (const boost::system::error_code &ec_);
    int process_greeting ();
    void handshake_step ();
    bool produce_handshake_output ();
    void start_handshake_write ();
    void on_handshake_write (const boost::system::error_code &ec_);
    void start_handshake_read ();
    void on_handshake_read (const boost::system::error_code &ec_,
                            std::size_t bytes_);
    void on_handshake_timer (const boost::system::error_code &ec_);
    void finish_handshake (int rc_, int err_);

    //  Receive loop, on the I/O thread.
    void start_receiving (channel_t *channel_, uint32_t connection_id_);
    void start_read ();
    void on_read (const boost::system::error_code &ec_, std::size_t bytes_);
    int process_input ();
    int deliver_frame ();
    void deliver (msg_t *msg_);
    void deliver_error (int err_);

    //  Send, on the I/O thread.
    void start_write (completion_t *written_);

    void do_close ();

    //  Releases the waiters once nothing is outstanding any more.
    void check_idle ();

    boost::asio::io_context &_io_context;

    //  Underlying transport, owned.
    i_transport *_transport;

    const options_t _options;
    const std::string _local_address;
    const std::string _remote_address;

    frame_encoder_t _encoder;
    frame_decoder_t *_decoder;
    mechanism_t *_mechanism;

    int _mechanism_type;
    bool _as_server;

    boost::asio::steady_timer _handshake_timer;

    unsigned char _greeting_send[zmtp_greeting_size];
    unsigned char _greeting_recv[zmtp_greeting_size];

    //  Bytes read but not yet decoded are _inbuf[_inpos, _insize).
    unsigned char _inbuf[in_batch_size];
    size_t _inpos;
    size_t _insize;

    std::vector<unsigned char> _handshake_out;

    //  State touched only by the I/O thread.
    int _outstanding;
    bool _reading;
    bool _writing;
    bool _greeting_received;
    bool _handshake_finished;
    int _handshake_rc;
    int _handshake_err;
    bool _closed;

    //  Receive loop state.
    channel_t *_channel;
    uint32_t _connection_id;
    msg_t _body;
    bool _assembling;

    //  Guards the flags below and orders posts against close.
    mutex_t _sync;
    bool _prepare_started;
    bool _close_requested;

    //  Serializes concurrent send_frame calls; guards _send_buf.
    mutex_t _send_sync;
    std::vector<unsigned char> _send_buf;

    completion_t _prepared;
    completion_t _close_done;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (zmtp_engine_t)
};
}

#endif

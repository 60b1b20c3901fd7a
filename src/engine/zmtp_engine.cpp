/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "engine/zmtp_engine.hpp"
#include "core/channel.hpp"
#include "core/io_thread.hpp"
#include "mechanism/mechanism.hpp"
#include "protocol/frame_decoder.hpp"
#include "transports/i_transport.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <chrono>

zsock::zmtp_engine_t::zmtp_engine_t (io_thread_t *io_thread_,
                                     i_transport *transport_,
                                     const options_t &options_) :
    _io_context (io_thread_->get_io_context ()),
    _transport (transport_),
    _options (options_),
    _local_address (transport_->local_address ()),
    _remote_address (transport_->remote_address ()),
    _decoder (NULL),
    _mechanism (NULL),
    _mechanism_type (ZSOCK_NULL),
    _as_server (false),
    _handshake_timer (_io_context),
    _inpos (0),
    _insize (0),
    _outstanding (0),
    _reading (false),
    _writing (false),
    _greeting_received (false),
    _handshake_finished (false),
    _handshake_rc (0),
    _handshake_err (0),
    _closed (false),
    _channel (NULL),
    _connection_id (0),
    _assembling (false),
    _prepare_started (false),
    _close_requested (false)
{
    zsock_assert (_transport);

    _decoder = new (std::nothrow) frame_decoder_t (_options.maxmsgsize);
    alloc_assert (_decoder);

    const int rc = _body.init ();
    errno_assert (rc == 0);

    ZSOCK_DBG_ENGINE ("created for %s <-> %s", _local_address.c_str (),
                      _remote_address.c_str ());
}

zsock::zmtp_engine_t::~zmtp_engine_t ()
{
    const int rc = _body.close ();
    errno_assert (rc == 0);

    LIBZSOCK_DELETE (_mechanism);
    LIBZSOCK_DELETE (_decoder);
    LIBZSOCK_DELETE (_transport);
}

int zsock::zmtp_engine_t::prepare (int mechanism_,
                                   int socket_type_,
                                   bool as_server_,
                                   const metadata_t *extra_,
                                   metadata_t *peer_)
{
    {
        scoped_lock_t lock (_sync);
        if (_close_requested) {
            errno = ETERM;
            return -1;
        }
        zsock_assert (!_prepare_started);

        _mechanism = mechanism_t::create (mechanism_, as_server_, socket_type_,
                                          _options, extra_);
        if (!_mechanism)
            return -1;

        _mechanism_type = mechanism_;
        _as_server = as_server_;

        //  Posted under the lock so that a later close is handled after it.
        _prepare_started = true;
        boost::asio::post (_io_context, [this] () { start_handshake (); });
    }

    const int rc = _prepared.wait ();
    if (rc != 0) {
        const int err = errno;
        ZSOCK_LOG_ERROR ("handshake failed: %s", errno_to_string (err));
        errno = err;
        return -1;
    }

    if (peer_)
        *peer_ = _mechanism->peer_metadata ();
    return 0;
}

void zsock::zmtp_engine_t::recv (channel_t *channel_, uint32_t connection_id_)
{
    zsock_assert (channel_);

    scoped_lock_t lock (_sync);
    if (_close_requested)
        return;
    boost::asio::post (_io_context, [this, channel_, connection_id_] () {
        start_receiving (channel_, connection_id_);
    });
}

int zsock::zmtp_engine_t::send_frame (const void *data_, size_t size_)
{
    scoped_lock_t send_lock (_send_sync);

    _send_buf.clear ();
    _encoder.encode (data_, size_, 0, _send_buf);

    completion_t written;
    {
        scoped_lock_t lock (_sync);
        if (_close_requested) {
            errno = ENOTCONN;
            return -1;
        }
        completion_t *written_ptr = &written;
        boost::asio::post (_io_context,
                           [this, written_ptr] () { start_write (written_ptr); });
    }
    return written.wait ();
}

void zsock::zmtp_engine_t::close ()
{
    {
        scoped_lock_t lock (_sync);
        if (!_close_requested) {
            _close_requested = true;
            boost::asio::post (_io_context, [this] () { do_close (); });
        }
    }
    _close_done.wait ();
}

void zsock::zmtp_engine_t::cancel ()
{
    close ();
}

void zsock::zmtp_engine_t::start_handshake ()
{
    if (_closed)
        return;

    //  Compose the greeting: signature, version, mechanism and role.
    memset (_greeting_send, 0, zmtp_greeting_size);
    _greeting_send[0] = zmtp_signature_first;
    _greeting_send[8] = 1;
    _greeting_send[zmtp_signature_size - 1] = zmtp_signature_last;
    _greeting_send[zmtp_major_offset] = zmtp_version_major;
    _greeting_send[zmtp_minor_offset] = zmtp_version_minor;
    const char *name = mechanism_t::mechanism_name (_mechanism_type);
    zsock_assert (name && strlen (name) <= zmtp_mechanism_size);
    memcpy (_greeting_send + zmtp_mechanism_offset, name, strlen (name));
    _greeting_send[zmtp_as_server_offset] = _as_server ? 1 : 0;

    if (_options.handshake_ivl > 0) {
        _outstanding++;
        _handshake_timer.expires_after (
          std::chrono::milliseconds (_options.handshake_ivl));
        _handshake_timer.async_wait (
          [this] (const boost::system::error_code &ec) {
              on_handshake_timer (ec);
          });
    }

    _outstanding++;
    _writing = true;
    _transport->async_write (
      _greeting_send, zmtp_greeting_size,
      [this] (const boost::system::error_code &ec, std::size_t) {
          on_greeting_sent (ec);
      });

    _outstanding++;
    _reading = true;
    _transport->async_read (
      _greeting_recv, zmtp_greeting_size,
      [this] (const boost::system::error_code &ec, std::size_t) {
          on_greeting_received (ec);
      });
}

void zsock::zmtp_engine_t::on_greeting_sent (const boost::system::error_code &ec_)
{
    _outstanding--;
    _writing = false;

    if (!_handshake_finished) {
        if (ec_)
            finish_handshake (-1, error_code_to_errno (ec_));
        else
            handshake_step ();
    }
    check_idle ();
}

void zsock::zmtp_engine_t::on_greeting_received (
  const boost::system::error_code &ec_)
{
    _outstanding--;
    _reading = false;

    if (!_handshake_finished) {
        if (ec_)
            finish_handshake (-1, error_code_to_errno (ec_));
        else if (process_greeting () != 0)
            finish_handshake (-1, errno);
        else {
            _greeting_received = true;
            handshake_step ();
        }
    }
    check_idle ();
}

int zsock::zmtp_engine_t::process_greeting ()
{
    if (_greeting_recv[0] != zmtp_signature_first
        || _greeting_recv[zmtp_signature_size - 1] != zmtp_signature_last) {
        errno = EPROTO;
        return -1;
    }

    //  Only ZMTP 3.x peers are supported.
    if (_greeting_recv[zmtp_major_offset] < zmtp_version_major) {
        errno = EPROTO;
        return -1;
    }

    //  Both peers must use the same security mechanism.
    if (memcmp (_greeting_recv + zmtp_mechanism_offset,
                _greeting_send + zmtp_mechanism_offset, zmtp_mechanism_size)
        != 0) {
        ZSOCK_DBG_ENGINE ("peer mechanism differs from %s",
                          mechanism_t::mechanism_name (_mechanism_type));
        errno = ENOCOMPATPROTO;
        return -1;
    }

    return 0;
}

void zsock::zmtp_engine_t::handshake_step ()
{
    if (!_greeting_received)
        return;

    while (!_handshake_finished) {
        if (!_writing && produce_handshake_output ())
            start_handshake_write ();

        //  Results are reported once everything produced has been written,
        //  so that a peer being rejected receives our ERROR command first.
        const mechanism_t::status_t status = _mechanism->status ();
        if (status == mechanism_t::error) {
            if (!_writing)
                finish_handshake (-1, _mechanism->error_code ());
            return;
        }
        if (status == mechanism_t::ready) {
            if (!_writing)
                finish_handshake (0, 0);
            return;
        }

        if (_reading)
            return;
        if (_inpos == _insize) {
            start_handshake_read ();
            return;
        }

        size_t processed = 0;
        const int rc =
          _decoder->decode (_inbuf + _inpos, _insize - _inpos, processed);
        _inpos += processed;
        if (rc == -1) {
            finish_handshake (-1, errno);
            return;
        }
        if (rc == 0)
            continue;

        //  Only commands are valid until the handshake completes.
        msg_t *command = _decoder->msg ();
        if (!command->is_command ()) {
            finish_handshake (-1, EPROTO);
            return;
        }
        if (_mechanism->process_handshake_command (command) == -1) {
            finish_handshake (-1, errno);
            return;
        }
    }
}

bool zsock::zmtp_engine_t::produce_handshake_output ()
{
    zsock_assert (_handshake_out.empty ());

    msg_t command;
    int rc = command.init ();
    errno_assert (rc == 0);

    while (_mechanism->next_handshake_command (&command) == 0) {
        _encoder.encode (&command, _handshake_out);
        rc = command.close ();
        errno_assert (rc == 0);
        rc = command.init ();
        errno_assert (rc == 0);
    }

    rc = command.close ();
    errno_assert (rc == 0);
    return !_handshake_out.empty ();
}

void zsock::zmtp_engine_t::start_handshake_write ()
{
    _outstanding++;
    _writing = true;
    _transport->async_write (
      &_handshake_out[0], _handshake_out.size (),
      [this] (const boost::system::error_code &ec, std::size_t) {
          on_handshake_write (ec);
      });
}

void zsock::zmtp_engine_t::on_handshake_write (
  const boost::system::error_code &ec_)
{
    _outstanding--;
    _writing = false;
    _handshake_out.clear ();

    if (!_handshake_finished) {
        if (ec_)
            finish_handshake (-1, error_code_to_errno (ec_));
        else
            handshake_step ();
    }
    check_idle ();
}

void zsock::zmtp_engine_t::start_handshake_read ()
{
    _outstanding++;
    _reading = true;
    _transport->async_read_some (
      _inbuf, in_batch_size,
      [this] (const boost::system::error_code &ec, std::size_t bytes) {
          on_handshake_read (ec, bytes);
      });
}

void zsock::zmtp_engine_t::on_handshake_read (
  const boost::system::error_code &ec_, std::size_t bytes_)
{
    _outstanding--;
    _reading = false;

    if (!_handshake_finished) {
        if (ec_)
            finish_handshake (-1, error_code_to_errno (ec_));
        else {
            _inpos = 0;
            _insize = bytes_;
            handshake_step ();
        }
    }
    check_idle ();
}

void zsock::zmtp_engine_t::on_handshake_timer (
  const boost::system::error_code &ec_)
{
    _outstanding--;
    if (!ec_ && !_handshake_finished) {
        ZSOCK_LOG_WARN ("handshake timed out after %d ms",
                        _options.handshake_ivl);
        finish_handshake (-1, ETIMEDOUT);
    }
    check_idle ();
}

void zsock::zmtp_engine_t::finish_handshake (int rc_, int err_)
{
    if (_handshake_finished)
        return;

    _handshake_finished = true;
    _handshake_rc = rc_;
    _handshake_err = err_;
    _handshake_timer.cancel ();

    //  A failed handshake leaves nothing to talk to; aborting the transport
    //  also completes any read or write still in flight.
    if (rc_ != 0)
        _transport->close ();
}

void zsock::zmtp_engine_t::start_receiving (channel_t *channel_,
                                            uint32_t connection_id_)
{
    if (_closed)
        return;

    zsock_assert (_handshake_finished && _handshake_rc == 0);
    zsock_assert (!_channel);

    _channel = channel_;
    _connection_id = connection_id_;

    //  Bytes received together with the last handshake command.
    if (process_input () == -1) {
        deliver_error (errno);
        return;
    }
    start_read ();
}

void zsock::zmtp_engine_t::start_read ()
{
    _outstanding++;
    _reading = true;
    _transport->async_read_some (
      _inbuf, in_batch_size,
      [this] (const boost::system::error_code &ec, std::size_t bytes) {
          on_read (ec, bytes);
      });
}

void zsock::zmtp_engine_t::on_read (const boost::system::error_code &ec_,
                                    std::size_t bytes_)
{
    _outstanding--;
    _reading = false;

    //  Stopped by close; nothing is delivered.
    if (_closed) {
        check_idle ();
        return;
    }

    if (ec_) {
        ZSOCK_LOG_ERROR ("read failed: %s", ec_.message ().c_str ());
        deliver_error (error_code_to_errno (ec_));
        check_idle ();
        return;
    }

    _inpos = 0;
    _insize = bytes_;
    if (process_input () == -1)
        deliver_error (errno);
    else
        start_read ();
    check_idle ();
}

int zsock::zmtp_engine_t::process_input ()
{
    while (_inpos < _insize) {
        size_t processed = 0;
        const int rc =
          _decoder->decode (_inbuf + _inpos, _insize - _inpos, processed);
        _inpos += processed;
        if (rc == -1)
            return -1;
        if (rc == 0)
            break;
        if (deliver_frame () == -1)
            return -1;
    }
    return 0;
}

int zsock::zmtp_engine_t::deliver_frame ()
{
    msg_t *frame = _decoder->msg ();

    if (frame->is_command ()) {
        //  Commands cannot interrupt a multipart message.
        if (_assembling) {
            errno = EPROTO;
            return -1;
        }
        deliver (frame);
        return 0;
    }

    //  Single frame message, hand the frame over as is.
    if (!_assembling && !_decoder->more ()) {
        deliver (frame);
        return 0;
    }

    //  The frames of a multipart message form one body, which is bound by
    //  the same limit as a single frame.
    if (_options.maxmsgsize >= 0
        && _body.size () + frame->size ()
             > static_cast<uint64_t> (_options.maxmsgsize)) {
        errno = EMSGSIZE;
        return -1;
    }
    if (_body.append (frame->data (), frame->size ()) == -1)
        return -1;
    _assembling = _decoder->more ();
    if (!_assembling)
        deliver (&_body);
    return 0;
}

void zsock::zmtp_engine_t::deliver (msg_t *msg_)
{
    msg_t msg;
    int rc = msg.init ();
    errno_assert (rc == 0);
    rc = msg.move (*msg_);
    errno_assert (rc == 0);

    msg.set_connection_id (_connection_id);
    _channel->push (&msg);

    rc = msg.close ();
    errno_assert (rc == 0);
}

void zsock::zmtp_engine_t::deliver_error (int err_)
{
    msg_t msg;
    int rc = msg.init ();
    errno_assert (rc == 0);
    msg.set_err (err_);
    msg.set_connection_id (_connection_id);
    _channel->push (&msg);
    rc = msg.close ();
    errno_assert (rc == 0);
}

void zsock::zmtp_engine_t::start_write (completion_t *written_)
{
    if (_closed) {
        written_->set (-1, ENOTCONN);
        return;
    }

    _outstanding++;
    _transport->async_write (
      &_send_buf[0], _send_buf.size (),
      [this, written_] (const boost::system::error_code &ec, std::size_t) {
          _outstanding--;
          if (ec)
              written_->set (-1, error_code_to_errno (ec));
          else
              written_->set (0, 0);
          check_idle ();
      });
}

void zsock::zmtp_engine_t::do_close ()
{
    zsock_assert (!_closed);
    _closed = true;

    ZSOCK_DBG_ENGINE ("closing, %d operations outstanding", _outstanding);

    if (!_handshake_finished)
        finish_handshake (-1, ETERM);
    _handshake_timer.cancel ();
    _transport->close ();

    check_idle ();
}

void zsock::zmtp_engine_t::check_idle ()
{
    if (_outstanding > 0)
        return;

    if (_handshake_finished)
        _prepared.set (_handshake_rc, _handshake_err);
    if (_closed)
        _close_done.set (0, 0);
}

/*
 * 설명: 엔드포인트에 연결해 핸드셰이크를 수행하고, 프레임 송수신과 백프레셔, 종료를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/e2e/websocket_transport_test.cpp
 */
#include "client/websocket_transport.hpp"

#include "client/idle_timer.hpp"

#include <deque>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

namespace client {
namespace {

template <bool Secure>
class BeastWebSocketTransport : public Transport,
                                public std::enable_shared_from_this<BeastWebSocketTransport<Secure>> {
 public:
  using NextLayer =
      std::conditional_t<Secure, boost::beast::ssl_stream<boost::beast::tcp_stream>, boost::beast::tcp_stream>;
  using Stream = boost::beast::websocket::stream<NextLayer>;

  BeastWebSocketTransport(boost::asio::io_context& ioc, boost::asio::ssl::context& ssl_ctx,
                          const TransportLimits& limits)
      : strand_(boost::asio::make_strand(ioc)), resolver_(strand_), deadline_(strand_), limits_(limits) {
    if constexpr (Secure) {
      ws_ = std::make_unique<Stream>(strand_, ssl_ctx);
    } else {
      static_cast<void>(ssl_ctx);
      ws_ = std::make_unique<Stream>(strand_);
    }
  }

  void Connect(const Endpoint& endpoint, const std::string& auth_token, TransportHandlers handlers) override {
    boost::asio::post(strand_, [self = this->shared_from_this(), endpoint, auth_token,
                                handlers = std::move(handlers)]() mutable {
      self->DoConnect(endpoint, auth_token, std::move(handlers));
    });
  }

  void Send(std::string message) override {
    boost::asio::post(strand_, [self = this->shared_from_this(), message = std::move(message)]() mutable {
      self->EnqueueMessage(std::move(message));
    });
  }

  void Close() override {
    boost::asio::post(strand_, [self = this->shared_from_this()]() { self->DoClose(); });
  }

 private:
  void DoConnect(const Endpoint& endpoint, const std::string& auth_token, TransportHandlers handlers) {
    handlers_ = std::move(handlers);
    if (closing_ || started_) {
      FailConnect(ConnectError::kProtocolError, "이미 사용된 전송 계층입니다");
      return;
    }
    started_ = true;
    endpoint_ = endpoint;
    token_ = auth_token;

    deadline_.expires_after(limits_.connect_timeout);
    deadline_.async_wait([self = this->shared_from_this()](const boost::system::error_code& ec) {
      if (!ec) {
        self->OnDeadline();
      }
    });

    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        [self = this->shared_from_this()](boost::beast::error_code ec,
                                          boost::asio::ip::tcp::resolver::results_type results) {
          self->OnResolve(ec, results);
        });
  }

  void OnDeadline() {
    if (connected_ || finished_) {
      return;
    }
    timed_out_ = true;
    resolver_.cancel();
    boost::beast::get_lowest_layer(*ws_).cancel();
  }

  void OnResolve(boost::beast::error_code ec, const boost::asio::ip::tcp::resolver::results_type& results) {
    if (ec || closing_) {
      return FailConnect(ConnectError::kUnreachable, ec.message());
    }
    boost::beast::get_lowest_layer(*ws_).async_connect(
        results, [self = this->shared_from_this()](boost::beast::error_code connect_ec,
                                                   boost::asio::ip::tcp::resolver::results_type::endpoint_type) {
          self->OnTcpConnect(connect_ec);
        });
  }

  void OnTcpConnect(boost::beast::error_code ec) {
    if (ec || closing_) {
      return FailConnect(ConnectError::kUnreachable, ec.message());
    }
    if constexpr (Secure) {
      if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint_.host.c_str())) {
        return FailConnect(ConnectError::kProtocolError, "TLS SNI 설정에 실패했습니다");
      }
      ws_->next_layer().set_verify_callback(boost::asio::ssl::host_name_verification(endpoint_.host));
      ws_->next_layer().async_handshake(boost::asio::ssl::stream_base::client,
                                        [self = this->shared_from_this()](boost::beast::error_code tls_ec) {
                                          self->OnTlsHandshake(tls_ec);
                                        });
    } else {
      StartUpgrade();
    }
  }

  void OnTlsHandshake(boost::beast::error_code ec) {
    if (ec || closing_) {
      return FailConnect(timed_out_ ? ConnectError::kUnreachable : ConnectError::kProtocolError, ec.message());
    }
    StartUpgrade();
  }

  void StartUpgrade() {
    ws_->set_option(boost::beast::websocket::stream_base::decorator(
        [token = token_](boost::beast::websocket::request_type& req) {
          req.set(boost::beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " collab-client");
          if (!token.empty()) {
            req.set(boost::beast::http::field::authorization, "Bearer " + token);
          }
        }));
    ws_->async_handshake(upgrade_response_, endpoint_.HostHeader(), endpoint_.target,
                         [self = this->shared_from_this()](boost::beast::error_code ec) { self->OnUpgrade(ec); });
  }

  void OnUpgrade(boost::beast::error_code ec) {
    if (closing_) {
      CloseSocket();
      return FailConnect(ConnectError::kUnreachable, "client_closed");
    }
    if (ec) {
      const auto status = upgrade_response_.result();
      if (status == boost::beast::http::status::unauthorized || status == boost::beast::http::status::forbidden) {
        return FailConnect(ConnectError::kAuthRejected, "인증 토큰이 거부되었습니다");
      }
      return FailConnect(timed_out_ ? ConnectError::kUnreachable : ConnectError::kProtocolError, ec.message());
    }
    deadline_.cancel();
    connected_ = true;
    ws_->set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
    ws_->text(true);
    if (handlers_.on_connect) {
      handlers_.on_connect(ConnectResult{true, ConnectError::kUnreachable, ""});
    }
    DoRead();
    if (!send_queue_.empty() && !writing_) {
      WriteNext();
    }
  }

  void FailConnect(ConnectError error, const std::string& message) {
    if (finished_) {
      return;
    }
    finished_ = true;
    deadline_.cancel();
    CloseSocket();
    if (closing_) {
      NotifyClosed("client_closed");
      return;
    }
    if (timed_out_ && error != ConnectError::kAuthRejected) {
      error = ConnectError::kUnreachable;
    }
    if (handlers_.on_connect) {
      handlers_.on_connect(ConnectResult{false, error, timed_out_ ? "연결 시간이 초과되었습니다" : message});
    }
  }

  void DoRead() {
    if (closing_) {
      return;
    }
    ws_->async_read(buffer_, [self = this->shared_from_this()](boost::beast::error_code ec,
                                                              std::size_t bytes_transferred) {
      self->OnRead(ec, bytes_transferred);
    });
  }

  void OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      if (closing_ || close_pending_) {
        NotifyClosed("client_closed");
      } else if (ec == boost::beast::websocket::error::closed) {
        const auto& reason = ws_->reason();
        NotifyClosed(reason.reason.empty() ? std::string{"server_closed"}
                                           : std::string(reason.reason.data(), reason.reason.size()));
      } else {
        NotifyClosed(ec.message());
      }
      return;
    }

    auto data = boost::beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (handlers_.on_message) {
      handlers_.on_message(std::move(data));
    }
    DoRead();
  }

  void EnqueueMessage(std::string message) {
    if (closing_ || close_pending_ || finished_closed_) {
      return;
    }
    const auto message_size = message.size();
    if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + message_size > limits_.max_queue_bytes) {
      TriggerBackpressureClose();
      return;
    }
    send_queue_.push_back(std::move(message));
    queued_bytes_ += message_size;
    if (connected_ && !writing_) {
      WriteNext();
    }
  }

  void WriteNext() {
    if (send_queue_.empty() || closing_) {
      return;
    }
    writing_ = true;
    ws_->async_write(boost::asio::buffer(send_queue_.front()),
                     [self = this->shared_from_this()](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                       self->OnWrite(ec);
                     });
  }

  void OnWrite(boost::beast::error_code ec) {
    writing_ = false;
    if (!send_queue_.empty()) {
      queued_bytes_ -= send_queue_.front().size();
      send_queue_.pop_front();
    }
    if (ec) {
      return;
    }
    if (!send_queue_.empty()) {
      WriteNext();
    } else if (close_pending_) {
      StartClose();
    }
  }

  void TriggerBackpressureClose() {
    if (closing_) {
      return;
    }
    closing_ = true;
    send_queue_.clear();
    queued_bytes_ = 0;
    if (!connected_) {
      CloseSocket();
      NotifyClosed("backpressure_exceeded");
      return;
    }
    boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
    reason.reason = "backpressure_exceeded";
    ws_->async_close(reason, [self = this->shared_from_this()](boost::beast::error_code) {
      self->NotifyClosed("backpressure_exceeded");
    });
  }

  void DoClose() {
    if (closing_ || close_pending_) {
      return;
    }
    deadline_.cancel();
    resolver_.cancel();
    if (!connected_ || finished_closed_) {
      closing_ = true;
      send_queue_.clear();
      queued_bytes_ = 0;
      CloseSocket();
      if (!started_ || finished_) {
        NotifyClosed("client_closed");
      }
      return;
    }
    if (writing_ || !send_queue_.empty()) {
      close_pending_ = true;
      if (!writing_) {
        WriteNext();
      }
      return;
    }
    StartClose();
  }

  void StartClose() {
    closing_ = true;
    close_pending_ = false;
    ws_->async_close(boost::beast::websocket::close_code::normal,
                     [self = this->shared_from_this()](boost::beast::error_code) {
                       self->NotifyClosed("client_closed");
                     });
  }

  void CloseSocket() {
    boost::beast::error_code ec;
    boost::beast::get_lowest_layer(*ws_).socket().close(ec);
  }

  void NotifyClosed(const std::string& reason) {
    if (finished_closed_) {
      return;
    }
    finished_closed_ = true;
    finished_ = true;
    deadline_.cancel();
    if (handlers_.on_closed) {
      handlers_.on_closed(reason);
    }
  }

  Strand strand_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::steady_timer deadline_;
  std::unique_ptr<Stream> ws_;
  TransportLimits limits_;
  TransportHandlers handlers_;
  Endpoint endpoint_;
  std::string token_;
  boost::beast::websocket::response_type upgrade_response_;
  boost::beast::flat_buffer buffer_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool started_{false};
  bool connected_{false};
  bool timed_out_{false};
  bool finished_{false};
  bool finished_closed_{false};
  bool writing_{false};
  bool close_pending_{false};
  bool closing_{false};
};

}  // namespace

std::shared_ptr<Transport> MakeWebSocketTransport(boost::asio::io_context& ioc, boost::asio::ssl::context& ssl_ctx,
                                                  bool secure, const TransportLimits& limits) {
  if (secure) {
    return std::make_shared<BeastWebSocketTransport<true>>(ioc, ssl_ctx, limits);
  }
  return std::make_shared<BeastWebSocketTransport<false>>(ioc, ssl_ctx, limits);
}

}  // namespace client

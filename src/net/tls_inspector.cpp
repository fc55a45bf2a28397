#include "net/tls_inspector.hpp"

#include <openssl/asn1.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <ctime>
#include <sstream>

#include "net/socket.hpp"

namespace netmon_agent::net {
namespace {

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const {
    if (ctx != nullptr) {
      SSL_CTX_free(ctx);
    }
  }
};

struct SslDeleter {
  void operator()(SSL* ssl) const {
    if (ssl != nullptr) {
      SSL_free(ssl);
    }
  }
};

struct X509Deleter {
  void operator()(X509* cert) const {
    if (cert != nullptr) {
      X509_free(cert);
    }
  }
};

std::string last_ssl_error(const char* fallback) {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return fallback;
  }
  char buffer[256]{};
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

std::string entry_value(const X509_NAME_ENTRY* entry) {
  const ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
  unsigned char* utf8 = nullptr;
  const int length = ASN1_STRING_to_UTF8(&utf8, data);
  if (length < 0 || utf8 == nullptr) {
    return {};
  }
  std::string value(reinterpret_cast<const char*>(utf8), static_cast<std::size_t>(length));
  OPENSSL_free(utf8);
  return value;
}

// "C=US, O=Let's Encrypt, CN=R3"
std::string format_name(const X509_NAME* name) {
  std::ostringstream out;
  const int count = X509_NAME_entry_count(name);
  for (int i = 0; i < count; ++i) {
    const X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, i);
    const int nid = OBJ_obj2nid(X509_NAME_ENTRY_get_object(entry));
    const char* short_name = nid != NID_undef ? OBJ_nid2sn(nid) : "?";
    if (i != 0) {
      out << ", ";
    }
    out << short_name << '=' << entry_value(entry);
  }
  return out.str();
}

std::string common_name_or_full(const X509_NAME* name) {
  const int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if (index >= 0) {
    return entry_value(X509_NAME_get_entry(name, index));
  }
  return format_name(name);
}

class OpenSslInspector final : public TlsInspector {
 public:
  TlsInspectResult inspect(const std::string& host, const std::uint16_t port,
                           const std::chrono::milliseconds timeout) override {
    TlsInspectResult result{};
    const auto start = std::chrono::steady_clock::now();

    std::string connect_error;
    Socket socket = connect_tcp(host, port, timeout, &connect_error);
    if (!socket.valid()) {
      result.error = connect_error;
      return result;
    }
    set_io_timeout(socket, timeout);

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
    if (ctx == nullptr) {
      result.error = last_ssl_error("SSL_CTX_new failed");
      return result;
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(ctx.get()));
    if (ssl == nullptr) {
      result.error = last_ssl_error("SSL_new failed");
      return result;
    }
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());
    SSL_set_fd(ssl.get(), socket.fd());

    if (SSL_connect(ssl.get()) != 1) {
      result.error = last_ssl_error("TLS handshake failed");
      return result;
    }
    result.response_time_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    std::unique_ptr<X509, X509Deleter> cert(SSL_get1_peer_certificate(ssl.get()));
    if (cert == nullptr) {
      result.error = "no certificate presented";
      SSL_shutdown(ssl.get());
      return result;
    }

    std::tm expiry{};
    if (ASN1_TIME_to_tm(X509_get0_notAfter(cert.get()), &expiry) != 1) {
      result.error = "unreadable certificate expiry";
      SSL_shutdown(ssl.get());
      return result;
    }

    result.certificate = CertificateInfo{
        .valid_to = std::chrono::system_clock::from_time_t(timegm(&expiry)),
        .issuer = format_name(X509_get_issuer_name(cert.get())),
        .subject = common_name_or_full(X509_get_subject_name(cert.get())),
    };
    SSL_shutdown(ssl.get());
    return result;
  }
};

}  // namespace

std::unique_ptr<TlsInspector> make_openssl_inspector() { return std::make_unique<OpenSslInspector>(); }

}  // namespace netmon_agent::net

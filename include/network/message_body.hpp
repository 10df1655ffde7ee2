#ifndef BACKUPER_NETWORK_MESSAGE_BODY_HPP
#define BACKUPER_NETWORK_MESSAGE_BODY_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace backuper {
namespace network {

// Produces a request body piece by piece so it never has to be held in memory
class BodySource {
public:
    virtual ~BodySource() = default;

    virtual std::string content_type() const = 0;
    // Exact number of bytes read() will produce
    virtual std::uint64_t size() const = 0;
    // Copies up to capacity bytes into buffer, returns 0 once exhausted or failed
    virtual std::size_t read(char* buffer, std::size_t capacity) = 0;
    virtual bool failed() const = 0;

protected:
    BodySource() = default;
};

// multipart/form-data body with one text field followed by one file part
class MultipartFileBody : public BodySource {
public:
    // ---- CONSTRUCTOR ----
    // The file stream must stay alive and positioned at its start until
    // the body has been fully read
    MultipartFileBody(const std::string& field_name, const std::string& field_value,
                      const std::string& file_field_name, const std::string& file_name,
                      std::istream& file, std::uint64_t file_size,
                      const std::string& boundary = generate_boundary());


    // ---- BODY SOURCE ----
    std::string content_type() const override;
    std::uint64_t size() const override;
    std::size_t read(char* buffer, std::size_t capacity) override;
    bool failed() const override { return failed_; }

    const std::string& boundary() const { return boundary_; }
    static std::string generate_boundary();

private:
    // ---- PARAMETERS ----
    std::string boundary_;
    std::string prefix_;
    std::string suffix_;
    std::istream& file_;
    std::uint64_t file_size_;

    // Read progress
    std::size_t prefix_sent_ = 0;
    std::uint64_t file_sent_ = 0;
    std::size_t suffix_sent_ = 0;
    bool failed_ = false;

    std::size_t copy_part(const std::string& part, std::size_t& sent, char* buffer, std::size_t capacity);
    static std::string quote_parameter(const std::string& value);
};


// Receives the body of a successful response chunk by chunk
class BodySink {
public:
    virtual ~BodySink() = default;

    // Called once, before the first write, when a 200 response header arrives
    virtual bool open() = 0;
    virtual bool write(const char* data, std::size_t size) = 0;

protected:
    BodySink() = default;
};

// Collects the body in memory, used for JSON replies
class StringSink : public BodySink {
public:
    bool open() override { return true; }
    bool write(const char* data, std::size_t size) override {
        data_.append(data, size);
        return true;
    }

    const std::string& str() const { return data_; }

private:
    std::string data_;
};

} // namespace network
} // namespace backuper

#endif // BACKUPER_NETWORK_MESSAGE_BODY_HPP

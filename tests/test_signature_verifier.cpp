#include "GuardDog/SignatureVerifier.hpp"

#include "TestSupport.hpp"

#include <string>

using namespace guarddog;
using testsupport::SigningKey;

namespace {

const std::string kMessage = "0000000000000000000000000000000000000000000000000000000000000000  GuardDog.exe\n";

std::string replaceLine(const std::string &file, std::size_t index, const std::string &replacement) {
    std::string result;
    std::size_t start = 0;
    for (std::size_t line = 0; start <= file.size(); ++line) {
        const auto end = file.find('\n', start);
        const std::string current = file.substr(start, end == std::string::npos ? std::string::npos : end - start);
        result += (line == index ? replacement : current);
        if (end == std::string::npos) {
            break;
        }
        result += '\n';
        start = end + 1;
    }
    return result;
}

std::string lineAt(const std::string &file, std::size_t index) {
    std::size_t start = 0;
    for (std::size_t line = 0; line < index; ++line) {
        start = file.find('\n', start) + 1;
    }
    return file.substr(start, file.find('\n', start) - start);
}

} // namespace

void test_valid_signatures() {
    std::cout << "\n[ValidSignatures]\n";
    SigningKey key;
    SignatureVerifier verifier(key.publicKey());
    ASSERT_TRUE("pre-hashed ED signature verifies", verifier.verify(kMessage, key.signFile(kMessage, "ED")));
    ASSERT_TRUE("legacy Ed signature verifies", verifier.verify(kMessage, key.signFile(kMessage, "Ed")));

    std::string crlf = key.signFile(kMessage);
    std::string converted;
    for (char ch : crlf) {
        if (ch == '\n') {
            converted += '\r';
        }
        converted += ch;
    }
    ASSERT_TRUE("CRLF signature file verifies", verifier.verify(kMessage, converted));
}

void test_public_key_parsing() {
    std::cout << "\n[PublicKeyParsing]\n";
    SigningKey key;
    const auto parsed = PublicKey::fromMinisign(key.publicKeyLine());
    ASSERT_TRUE("minisign public key parses", parsed.has_value());
    ASSERT_TRUE("key id preserved", parsed && parsed->keyId == key.publicKey().keyId);
    ASSERT_TRUE("key bytes preserved", parsed && parsed->key == key.publicKey().key);
    ASSERT_TRUE("truncated key rejected", !PublicKey::fromMinisign(key.publicKeyLine().substr(4)).has_value());
    ASSERT_TRUE("garbage rejected", !PublicKey::fromMinisign("not a key").has_value());
}

void test_message_tampering() {
    std::cout << "\n[MessageTampering]\n";
    SigningKey key;
    SignatureVerifier verifier(key.publicKey());
    const std::string signature = key.signFile(kMessage);

    std::string reason;
    std::string altered = kMessage;
    altered[0] = '1';
    ASSERT_TRUE("altered message rejected", !verifier.verify(altered, signature, &reason));
    ASSERT_EQ("reason names the mismatch", std::string("signature does not match the manifest"), reason);
    ASSERT_TRUE("appended byte rejected", !verifier.verify(kMessage + " ", signature));
}

void test_signature_bit_flips() {
    std::cout << "\n[SignatureBitFlips]\n";
    SigningKey key;
    SignatureVerifier verifier(key.publicKey());
    const std::string file = key.signFile(kMessage);
    const auto blob = crypto::base64Decode(lineAt(file, 1));
    ASSERT_TRUE("signature blob decodes", blob.has_value());
    if (!blob) {
        return;
    }

    // Bytes 10.. hold the Ed25519 signature itself.
    bool everyFlipRejected = true;
    for (std::size_t byte = 10; byte < blob->size(); byte += 7) {
        for (int bit = 0; bit < 8; bit += 3) {
            std::string flipped = *blob;
            flipped[byte] = static_cast<char>(flipped[byte] ^ (1 << bit));
            const std::string tampered = replaceLine(file, 1, crypto::base64Encode(flipped));
            if (verifier.verify(kMessage, tampered)) {
                everyFlipRejected = false;
            }
        }
    }
    ASSERT_TRUE("every flipped signature bit is rejected", everyFlipRejected);

    const auto global = crypto::base64Decode(lineAt(file, 3));
    std::string flippedGlobal = *global;
    flippedGlobal[5] = static_cast<char>(flippedGlobal[5] ^ 0x40);
    ASSERT_TRUE("flipped global signature rejected",
                !verifier.verify(kMessage, replaceLine(file, 3, crypto::base64Encode(flippedGlobal))));
}

void test_trusted_comment_is_signed() {
    std::cout << "\n[TrustedComment]\n";
    SigningKey key;
    SignatureVerifier verifier(key.publicKey());
    const std::string file = key.signFile(kMessage, "ED", "timestamp:1700000000");
    std::string reason;
    ASSERT_TRUE("edited trusted comment rejected",
                !verifier.verify(kMessage, replaceLine(file, 2, "trusted comment: timestamp:1800000000"), &reason));
    ASSERT_EQ("reason names the trusted comment", std::string("trusted comment signature does not verify"), reason);
}

void test_wrong_key() {
    std::cout << "\n[WrongKey]\n";
    SigningKey signer({1, 1, 1, 1, 1, 1, 1, 1});
    SigningKey other({2, 2, 2, 2, 2, 2, 2, 2});
    SigningKey sameId({1, 1, 1, 1, 1, 1, 1, 1});
    const std::string file = signer.signFile(kMessage);

    std::string reason;
    ASSERT_TRUE("different key id rejected", !SignatureVerifier(other.publicKey()).verify(kMessage, file, &reason));
    ASSERT_EQ("reason names the key", std::string("signature was made with a different key"), reason);
    ASSERT_TRUE("same key id but different key rejected",
                !SignatureVerifier(sameId.publicKey()).verify(kMessage, file));
}

void test_malformed_files() {
    std::cout << "\n[MalformedFiles]\n";
    SigningKey key;
    SignatureVerifier verifier(key.publicKey());
    const std::string file = key.signFile(kMessage);

    ASSERT_TRUE("empty signature rejected", !verifier.verify(kMessage, ""));
    ASSERT_TRUE("missing global signature rejected",
                !verifier.verify(kMessage, file.substr(0, file.rfind('\n', file.size() - 2) + 1)));
    ASSERT_TRUE("missing untrusted comment prefix rejected",
                !verifier.verify(kMessage, replaceLine(file, 0, "comment: x")));
    ASSERT_TRUE("invalid base64 rejected", !verifier.verify(kMessage, replaceLine(file, 1, "!!!!")));
    ASSERT_TRUE("trailing garbage rejected", !verifier.verify(kMessage, file + "extra\n"));

    auto blob = *crypto::base64Decode(lineAt(file, 1));
    blob[0] = 'X';
    ASSERT_TRUE("unknown algorithm rejected",
                !verifier.verify(kMessage, replaceLine(file, 1, crypto::base64Encode(blob))));
}

int main() {
    std::cout << "=== Signature Verifier Tests ===\n";

    test_valid_signatures();
    test_public_key_parsing();
    test_message_tampering();
    test_signature_bit_flips();
    test_trusted_comment_is_signed();
    test_wrong_key();
    test_malformed_files();

    return finishTests();
}

#include <cstdio>
#include <QCoreApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QStringList>
#include "../core/common/exceptions.hpp"
#include "../core/sim/sim_bench.hpp"
#include "settings.hpp"

using namespace std;

static bool read_file(const QString& path, QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        printf("Failed to open %s\n", path.toLocal8Bit().constData());
        return false;
    }
    data = file.readAll();
    return true;
}

static bool parse_hex(const QString& hex, int len, QByteArray& data)
{
    data = QByteArray::fromHex(hex.toLatin1());
    if (data.size() != len)
    {
        printf("Expected %d hex bytes, got %d\n", len, data.size());
        return false;
    }
    return true;
}

static bool parse_key(const QString& hex, QByteArray& key, AES_Mode& mode)
{
    key = QByteArray::fromHex(hex.toLatin1());
    switch (key.size())
    {
        case 16:
            mode = AES_Mode::AES128;
            return true;
        case 24:
            mode = AES_Mode::AES192;
            return true;
        case 32:
            mode = AES_Mode::AES256;
            return true;
        default:
            printf("Key must be 16, 24 or 32 hex bytes\n");
            return false;
    }
}

static bool parse_sha_mode(const QString& name, SHA_Mode& mode)
{
    const QString names[] = {"sha1", "sha224", "sha256", "sha384", "sha512"};
    const SHA_Mode modes[] = {SHA_Mode::SHA1, SHA_Mode::SHA224, SHA_Mode::SHA256, SHA_Mode::SHA384, SHA_Mode::SHA512};
    for (int i = 0; i < 5; i++)
    {
        if (name == names[i])
        {
            mode = modes[i];
            return true;
        }
    }
    printf("Unrecognized hash mode %s\n", name.toLocal8Bit().constData());
    return false;
}

static int print_result(SE_Result result, const uint8_t* data, int len)
{
    if (result != SE_Result::Success)
    {
        printf("Operation failed: %s\n", se_result_name(result));
        return 1;
    }

    QByteArray bytes((const char*)data, len);
    printf("%s\n", bytes.toHex().constData());
    return 0;
}

static int run_command(SimBench& bench, QCommandLineParser& parser, const QStringList& args)
{
    const QString& command = args[0];
    SecurityEngine& se = bench.se;

    if (command == "random")
    {
        bool ok = false;
        int len = args.size() > 1 ? args[1].toInt(&ok) : 0;
        if (!ok || len <= 0)
        {
            printf("random needs a positive byte count\n");
            return 1;
        }

        SE_Result result = se.initialize_rng();
        if (result != SE_Result::Success)
            return print_result(result, nullptr, 0);

        QByteArray output(len, 0);
        result = se.generate_random((uint8_t*)output.data(), len);
        return print_result(result, (const uint8_t*)output.constData(), len);
    }

    if (args.size() < 2)
    {
        printf("%s needs an input file\n", command.toLocal8Bit().constData());
        return 1;
    }

    QByteArray input;
    if (!read_file(args[1], input))
        return 1;
    const uint8_t* source = (const uint8_t*)input.constData();

    if (command == "sha")
    {
        SHA_Mode mode;
        if (!parse_sha_mode(parser.value("mode"), mode))
            return 1;

        uint8_t digest[SHA_MAX_DIGEST_SIZE];
        SE_Result result = se.calculate_sha(mode, source, input.size(), digest);
        return print_result(result, digest, SE_SHA::digest_size(mode));
    }

    QByteArray key;
    AES_Mode mode;
    if (!parse_key(parser.value("key"), key, mode))
        return 1;
    se.fill_aes_keyslot(0, (const uint8_t*)key.constData(), key.size());

    if (command == "cmac")
    {
        uint8_t mac[AES_BLOCK_SIZE];
        SE_Result result = se.aes_cmac(0, source, input.size(), mac, mode);
        return print_result(result, mac, AES_BLOCK_SIZE);
    }

    QByteArray iv;
    if (!parse_hex(parser.value("iv"), AES_BLOCK_SIZE, iv))
        return 1;
    const uint8_t* iv_data = (const uint8_t*)iv.constData();

    QByteArray output(input.size(), 0);
    uint8_t* destination = (uint8_t*)output.data();
    SE_Result result;
    if (command == "ctr")
        result = se.aes_ctr_crypt(0, source, destination, input.size(), iv_data, mode);
    else if (command == "cbc-encrypt")
        result = se.aes_cbc_encrypt(0, source, destination, input.size(), iv_data, mode);
    else if (command == "cbc-decrypt")
        result = se.aes_cbc_decrypt(0, source, destination, input.size(), iv_data, mode);
    else
    {
        printf("Unrecognized command %s\n", command.toLocal8Bit().constData());
        return 1;
    }
    return print_result(result, destination, output.size());
}

int main(int argc, char** argv)
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("sectl");

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs Security Engine operations against the simulated engine.");
    parser.addHelpOption();

    parser.addOptions(
    {
        {"timeout", "Deadline for each wait of an operation, in milliseconds.", "ms"},
        {"reseed-interval", "Blocks the DRBG generates between reseeds.", "blocks"},
        {"latency", "Status polls before the simulated engine completes an operation.", "polls"},
        {"mode", "Hash for the sha command: sha1, sha224, sha256, sha384 or sha512.", "mode", "sha256"},
        {"key", "AES key in hex for cmac, ctr, cbc-encrypt and cbc-decrypt.", "key"},
        {"iv", "IV or initial counter in hex.", "iv"}
    });
    parser.addPositionalArgument("command", "sha, random, cmac, ctr, cbc-encrypt or cbc-decrypt.");
    parser.addPositionalArgument("input", "Input file, or the byte count for random.");

    parser.process(a.arguments());

    Settings::load();

    if (parser.isSet("timeout"))
        Settings::timeout_ms = parser.value("timeout").toUInt();

    if (parser.isSet("reseed-interval"))
        Settings::reseed_interval = parser.value("reseed-interval").toUInt();

    if (parser.isSet("latency"))
        Settings::latency_polls = parser.value("latency").toInt();

    Settings::save();

    QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);

    SE_Config config;
    config.timeout_ms = Settings::timeout_ms;
    config.reseed_interval = Settings::reseed_interval;

    try
    {
        SimBench bench(config);
        bench.sim.set_latency(Settings::latency_polls);
        return run_command(bench, parser, args);
    }
    catch (SEException::FatalError& e)
    {
        printf("Fatal error: %s", e.what());
        return 1;
    }
}

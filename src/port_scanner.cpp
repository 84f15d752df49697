#include "port_scanner.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

namespace kube_auth_proxy {

const char* const kStartingServePattern = "starting to serve on (?<address>.+)";

PortFromStreamScanner::Options
PortFromStreamScanner::startingServeOptions(std::function<void()> onFind) {
    Options options;
    options.lineRegex    = boost::regex(kStartingServePattern, boost::regex::icase);
    options.captureGroup = "address";
    options.onFind       = std::move(onFind);
    return options;
}

PortFromStreamScanner::PortFromStreamScanner(net::io_context& ioc,
                                             std::shared_ptr<OutputStream> stream,
                                             Options options)
    : mStream(std::move(stream))
    , mOptions(std::move(options))
    , mDone(ioc) {}

PortFromStreamScanner::~PortFromStreamScanner() {
    detach();
}

uint16_t PortFromStreamScanner::scan(net::yield_context yield) {
    if (mScanStarted) {
        throw std::logic_error("PortFromStreamScanner::scan may only be called once");
    }
    mScanStarted = true;

    // A cancel() before scan() leaves mFinished set with its reason.
    if (!mFinished && mStream->ended()) {
        mFinished = true;
        mFailure  = "stream ended before scanning started";
    } else if (!mFinished) {
        mDataId = mStream->onData([this](const std::string& chunk) { onChunk(chunk); });
        mEndId  = mStream->onEnd([this] {
            // A final line without a trailing newline still counts.
            if (!mPending.empty()) {
                std::string last;
                last.swap(mPending);
                onLine(last);
            }
            if (!mFinished) {
                mFailure = "stream ended without a matching line";
                finish();
            }
        });
    }

    while (!mFinished) {
        mDone.wait(yield);
    }
    detach();

    if (!mPort) {
        throw PortDiscoveryFailed("Could not find port in stream: " + mFailure);
    }
    return *mPort;
}

void PortFromStreamScanner::cancel() {
    if (mFinished) return;
    mFailure = "scan cancelled";
    finish();
}

void PortFromStreamScanner::onChunk(const std::string& chunk) {
    mPending += chunk;

    std::string::size_type newline;
    while (!mFinished && (newline = mPending.find('\n')) != std::string::npos) {
        std::string line = mPending.substr(0, newline);
        mPending.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        onLine(line);
    }
}

void PortFromStreamScanner::onLine(const std::string& line) {
    if (mFinished) return;

    boost::smatch match;
    if (!boost::regex_search(line, match, mOptions.lineRegex)) {
        if (mVerbose) {
            std::cerr << "[PortScanner] skipping line: " << line << "\n";
        }
        return;
    }

    const auto port = parseTrailingPort(match[mOptions.captureGroup].str());
    if (!port) {
        std::cerr << "[PortScanner] matched line has no usable port: "
                  << line << "\n";
        return;
    }

    mPort = *port;
    if (mOptions.onFind) {
        mOptions.onFind();
    }
    finish();
}

void PortFromStreamScanner::finish() {
    mFinished = true;
    detach();
    mDone.notifyAll();
}

void PortFromStreamScanner::detach() {
    if (mDataId != 0) {
        mStream->removeListener(mDataId);
        mDataId = 0;
    }
    if (mEndId != 0) {
        mStream->removeListener(mEndId);
        mEndId = 0;
    }
}

} // namespace kube_auth_proxy

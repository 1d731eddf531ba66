#pragma once

#include <cstdio>
#include <memory>
#include <string_view>
#include <system_error>

#include "api.hpp"
#include "colortable.hpp"
#include "commandkind.hpp"
#include "config.hpp"
#include "normalize.hpp"
#include "result.hpp"

struct Context {
    const Settings& settings;
    const api::Client& client;
    FILE* in;
    FILE* out;
    FILE* err;
};

// Prints the one line an operation reports for an error. subject names what was being parsed or
// read, e.g. "fixtures" or a file path.
void reportError(FILE* err, const std::error_code& ec, std::string_view subject);

class Operation {
public:
    virtual ~Operation() = default;

    // Errors are reported on ctx.err. Returns false if the operation failed.
    virtual bool run(Context& ctx) = 0;
};

// Fetch, normalize, load the colors, render
template <typename Records>
class FetchRenderOperation : public Operation {
public:
    bool run(Context& ctx) override
    {
        const auto records = fetch(ctx);
        if (!records) {
            report(ctx, records.error());
            return false;
        }
        const auto colors = ColorTable::loadOrEmpty(ctx.settings.colorsPath);
        if (!colors) {
            reportError(ctx.err, colors.error(), ctx.settings.colorsPath);
            return false;
        }
        render(ctx, records.value(), colors.value());
        return true;
    }

protected:
    virtual Result<Records> fetch(Context& ctx) = 0;
    virtual void render(Context& ctx, const Records& records, const ColorTable& colors) = 0;

    virtual void report(Context& ctx, const std::error_code& ec)
    {
        reportError(ctx.err, ec, recordName());
    }

    virtual std::string_view recordName() const
    {
        return "fixtures";
    }
};

class ScheduleOperation : public FetchRenderOperation<FixtureGroups> {
protected:
    Result<FixtureGroups> fetch(Context& ctx) override;
    void render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors) override;
};

class LiveOperation : public FetchRenderOperation<FixtureGroups> {
protected:
    Result<FixtureGroups> fetch(Context& ctx) override;
    void render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors) override;
};

// Fetches the last few fixtures of every favorite team and shows all of them
// TODO: Only show the fixture closest to today for each team
class ScoresOperation : public FetchRenderOperation<FixtureGroups> {
protected:
    Result<FixtureGroups> fetch(Context& ctx) override;
    void render(Context& ctx, const FixtureGroups& groups, const ColorTable& colors) override;
    void report(Context& ctx, const std::error_code& ec) override;
};

class StandingsOperation : public FetchRenderOperation<StandingTables> {
protected:
    Result<StandingTables> fetch(Context& ctx) override;
    void render(Context& ctx, const StandingTables& tables, const ColorTable& colors) override;
    std::string_view recordName() const override;
};

// Interactive: add a team (looked up through the API) or remove one
class RosterEditOperation : public Operation {
public:
    bool run(Context& ctx) override;

private:
    bool add(Context& ctx);
    bool remove(Context& ctx);
};

std::unique_ptr<Operation> makeOperation(CommandKind kind);

bool runCommand(CommandKind kind, Context& ctx);

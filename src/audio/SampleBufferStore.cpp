#include "SampleBufferStore.h"
#include "SampleLoader.h"
#include "SamplerErrors.h"

SampleBufferStore::SampleBufferStore (SampleLoader& l,
                                      const std::map<juce::String, EntrySource>& sources,
                                      LoadCallback onload,
                                      const juce::String& base)
    : loader (l), baseUrl (base), onAllLoaded (std::move (onload))
{
    for (auto& [key, source] : sources)
        add (key, source);

    // Delivered asynchronously even when every entry was already resolved,
    // so the owner is fully constructed when it runs.
    juce::WeakReference<SampleBufferStore> weak (this);

    loaded().onSettled ([weak] (const juce::Result&)
    {
        juce::MessageManager::callAsync ([weak]
        {
            auto* store = weak.get();
            if (store == nullptr || store->disposed)
                return;

            if (store->onAllLoaded != nullptr)
                store->onAllLoaded();
        });
    });
}

SampleBufferStore::~SampleBufferStore()
{
    masterReference.clear();
}

juce::String SampleBufferStore::resolveLocation (const juce::String& location) const
{
    if (baseUrl.isEmpty() || location.contains ("://") || juce::File::isAbsolutePath (location))
        return location;

    return baseUrl + location;
}

void SampleBufferStore::add (const juce::String& key, EntrySource source,
                             LoadCallback onload, ErrorCallback onerror)
{
    throwIfDisposed();

    auto entry = std::make_shared<Entry>();
    entry->onload = std::move (onload);
    entry->onerror = std::move (onerror);

    std::weak_ptr<Entry> weakEntry = entry;

    SampleBuffer::FromOptions options;
    options.onload = [weakEntry]
    {
        if (auto e = weakEntry.lock())
        {
            e->state = LoadState::loaded;

            if (e->onload != nullptr)
                e->onload();
        }
    };
    options.onerror = [weakEntry, key] (const juce::String& error)
    {
        if (auto e = weakEntry.lock())
        {
            DBG ("Buffer '" + key + "' failed to load: " + error);
            e->state = LoadState::errored;
            e->error = error;

            if (e->onerror != nullptr)
                e->onerror (error);
        }
    };

    if (auto* location = std::get_if<juce::String> (&source))
    {
        auto resolved = resolveLocation (*location);
        entry->candidates = SampleLoader::expandCandidates (resolved);
        options.url = SampleBuffer::FromLocation { resolved };
    }
    else if (auto* data = std::get_if<SampleDataPtr> (&source))
    {
        options.url = SampleBuffer::FromData { *data };
    }
    else if (auto* buffer = std::get_if<const SampleBuffer*> (&source))
    {
        options.url = SampleBuffer::FromBuffer { *buffer };
    }

    entry->state = LoadState::loading;
    entry->buffer = std::make_unique<SampleBuffer> (loader, std::move (options));
    entry->pending = entry->buffer->getPendingLoad();

    // Resolved sources settle during construction without calling back.
    if (entry->pending.isSettled())
    {
        if (entry->buffer->isLoaded())
        {
            entry->state = LoadState::loaded;

            if (entry->onload != nullptr)
                entry->onload();
        }
        else
        {
            entry->state = LoadState::errored;
            entry->error = "Source for '" + key + "' has no sample data";
            DBG (entry->error);
        }
    }

    auto existing = entries.find (key);
    if (existing != entries.end())
        existing->second->buffer->dispose();

    entries[key] = std::move (entry);
}

bool SampleBufferStore::has (const juce::String& key) const
{
    throwIfDisposed();
    return entries.find (key) != entries.end();
}

SampleBuffer& SampleBufferStore::get (const juce::String& key) const
{
    throwIfDisposed();

    auto it = entries.find (key);
    if (it == entries.end() || it->second->state != LoadState::loaded)
        throw BufferNotAvailable (key.toStdString());

    return *it->second->buffer;
}

SampleBufferStore::LoadState SampleBufferStore::getState (const juce::String& key) const
{
    throwIfDisposed();

    auto it = entries.find (key);
    return it != entries.end() ? it->second->state : LoadState::unloaded;
}

juce::StringArray SampleBufferStore::getCandidates (const juce::String& key) const
{
    auto it = entries.find (key);
    return it != entries.end() ? it->second->candidates : juce::StringArray();
}

PendingLoad SampleBufferStore::loaded() const
{
    throwIfDisposed();

    std::vector<PendingLoad> pending;
    for (auto& [key, entry] : entries)
        pending.push_back (entry->pending);

    return PendingLoad::whenAll (pending);
}

bool SampleBufferStore::isLoaded() const
{
    throwIfDisposed();

    for (auto& [key, entry] : entries)
        if (entry->state != LoadState::loaded)
            return false;

    return true;
}

bool SampleBufferStore::supportsType (const juce::String& location) const
{
    return loader.supportsType (location);
}

void SampleBufferStore::dispose()
{
    if (disposed)
        return;

    disposed = true;

    for (auto& [key, entry] : entries)
        entry->buffer->dispose();

    entries.clear();
    onAllLoaded = nullptr;
}

void SampleBufferStore::throwIfDisposed() const
{
    if (disposed)
        throw InstanceDisposed ("SampleBufferStore");
}

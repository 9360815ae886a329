#include "tesseract_engine.hpp"
#include "utils.hpp"

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <stdexcept>

TesseractEngine::TesseractEngine(const string &language, const string &tessdata_path)
    : initialized(false), language(language), tessdata_path(tessdata_path)
{
}

TesseractEngine::~TesseractEngine()
{
    if (api)
        api->End();
}

bool TesseractEngine::initialize()
{
    api = make_unique<tesseract::TessBaseAPI>();

    const char *datapath = tessdata_path.empty() ? nullptr : tessdata_path.c_str();
    if (api->Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0)
    {
        log_error("Tesseract could not load language '" + language + "'" +
                  (tessdata_path.empty() ? string() : " from " + tessdata_path));
        api.reset();
        initialized = false;
        return false;
    }

    // Table text is scattered words, not paragraphs
    api->SetPageSegMode(tesseract::PSM_SPARSE_TEXT);
    api->SetVariable("debug_file", "/dev/null");

    initialized = true;
    log_info("Tesseract " + log_string_src(string(tesseract::TessBaseAPI::Version())) + " initialized (" + language + ")");
    return true;
}

vector<TextElement> TesseractEngine::recognize(const Mat &image)
{
    vector<TextElement> elements;

    if (!initialized)
        throw runtime_error("Tesseract engine used before initialization");
    if (image.empty())
        return elements;

    Mat gray;
    if (image.channels() == 3)
        cvtColor(image, gray, COLOR_BGR2GRAY);
    else
        gray = image;
    if (!gray.isContinuous())
        gray = gray.clone();

    api->SetImage(gray.data, gray.cols, gray.rows, 1, static_cast<int>(gray.step));
    if (api->Recognize(nullptr) != 0)
    {
        api->Clear();
        throw runtime_error("Tesseract recognition failed");
    }

    unique_ptr<tesseract::ResultIterator> it(api->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

    if (it)
    {
        do
        {
            unique_ptr<char[]> word(it->GetUTF8Text(level));
            if (!word)
                continue;

            TextElement element;
            element.text = word.get();
            element.confidence = it->Confidence(level) / 100.0f;

            int x1, y1, x2, y2;
            if (!it->BoundingBox(level, &x1, &y1, &x2, &y2))
                continue;
            element.bbox = Rect(x1, y1, x2 - x1, y2 - y1);

            // Trim whitespace Tesseract sometimes leaves on words
            size_t first = element.text.find_first_not_of(" \t\r\n");
            size_t last = element.text.find_last_not_of(" \t\r\n");
            if (first == string::npos)
                continue;
            element.text = element.text.substr(first, last - first + 1);

            elements.push_back(element);
        } while (it->Next(level));
    }

    api->Clear();
    return elements;
}
